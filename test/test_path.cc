#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "../lib/path.hpp"

using namespace std;
using namespace agentfs;

void test_pathsep()
{
    const char *path = "/usr/bin//env";
    vector<string> parts;

    while (path != nullptr) {
        parts.push_back(pathsep(path));
    }
    assert((parts == vector<string>{"usr", "bin", "env"}));
}

void test_valid_name()
{
    assert(valid_name("report.txt"));
    assert(valid_name("with space"));
    assert(valid_name(".hidden"));
    assert(!valid_name(""));
    assert(!valid_name("a/b"));
    assert(!valid_name(string("nul\0byte", 8)));
    assert(!valid_name("."));
    assert(!valid_name(".."));
    assert(valid_name(string(255, 'x')));
    assert(!valid_name(string(256, 'x')));
}

void test_prefixes()
{
    assert(join_path("", "a") == "/a");
    assert(join_path("/a", "b") == "/a/b");

    assert(is_below("/a/b", "/a"));
    assert(is_below("/a/b/c.txt", "/a"));
    assert(!is_below("/a", "/a"));
    assert(!is_below("/ab", "/a"));
    assert(!is_below("/b/a", "/a"));

    assert(rebase("/a/b/c.txt", "/a", "/z") == "/z/b/c.txt");
    assert(rebase("/a/b", "/a", "/x/y") == "/x/y/b");
}

void test_sanitize()
{
    assert(basename("dir/sub/report.pdf") == "report.pdf");
    assert(basename("plain") == "plain");
    assert(basename("trailing/") == "");

    assert(sanitize_filename("  my report (final).pdf ") == "my_report_final.pdf");
    assert(sanitize_filename("data-1_2.csv") == "data-1_2.csv");
    assert(sanitize_filename("***") == "");
    assert(sanitize_filename("..") == "");
    assert(sanitize_filename("   ") == "");
    // UTF-8 letters survive
    assert(sanitize_filename("r\xc3\xa9sum\xc3\xa9.pdf") == "r\xc3\xa9sum\xc3\xa9.pdf");
    assert(sanitize_filename("\xe6\x97\xa5\xe6\x9c\xac (1).txt") == "\xe6\x97\xa5\xe6\x9c\xac_1.txt");
}

int main()
{
    test_pathsep();
    test_valid_name();
    test_prefixes();
    test_sanitize();
    cout << "test_path: ok" << endl;
    return 0;
}

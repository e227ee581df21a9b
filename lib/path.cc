#include "path.hpp"

#include <cctype>
#include <cstring>

using namespace std;

namespace agentfs {

string pathsep(const char *&path)
{
    const char *p = path;
    string s;

    if (path == nullptr) {
        return "";
    }
    while (*path == SEP) {
        ++path;
    }
    p = strchr(path, SEP);
    if (p == nullptr) {
        s = string(path);
        path = nullptr;
    } else {
        s = string(path, p);
        while (*++p == SEP) {
        }
        path = *p ? p : nullptr;
    }
    return s;
}

bool valid_name(const string& name)
{
    if (name.empty() || name.size() > NAME_MAX_BYTES) {
        return false;
    }
    if (name == "." || name == "..") {
        return false;
    }
    return name.find(SEP) == string::npos && name.find('\0') == string::npos;
}

string join_path(const string& parent_path, const string& name)
{
    return parent_path + SEP + name;
}

bool is_below(const string& path, const string& dir)
{
    return path.size() > dir.size() + 1 &&
           path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == SEP;
}

string rebase(const string& path, const string& old_dir, const string& new_dir)
{
    return new_dir + path.substr(old_dir.size());
}

string basename(const string& path)
{
    auto pos = path.rfind(SEP);
    return pos == string::npos ? path : path.substr(pos + 1);
}

string sanitize_filename(const string& name)
{
    size_t first = 0, last = name.size();
    while (first < last && isspace(static_cast<unsigned char>(name[first]))) {
        ++first;
    }
    while (last > first && isspace(static_cast<unsigned char>(name[last - 1]))) {
        --last;
    }

    string s;
    for (size_t i = first; i < last; ++i) {
        unsigned char c = name[i];
        if (c == ' ') {
            s += '_';
        } else if (c >= 0x80 || isalnum(c) || c == '_' || c == '-' || c == '.') {
            // bytes of multi-byte UTF-8 sequences pass through whole
            s += static_cast<char>(c);
        }
    }
    if (s.empty() || s == "." || s == "..") {
        return "";
    }
    return s;
}

}

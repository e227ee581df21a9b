#ifndef INCLUDE_AGENTFS_IMPORTER_
#define INCLUDE_AGENTFS_IMPORTER_

#include <optional>
#include <string>
#include <vector>

#include "nodestore.hpp"

namespace agentfs {

constexpr char INBOX_DIR[] = "Inbox";
constexpr char FALLBACK_ATTACHMENT[] = "attachment";

struct Attachment {
    std::string filename;
    std::string data;
    std::string mime_type;
};

struct ImportedNode {
    std::string node_id;
    std::string path;
    std::string filename;
};

// Materializes received attachments as files under Inbox/<YYYY-MM-DD>.
class Importer {
  public:
    Importer(NodeStore& store, bool debug = false);

    int ensure_dir(const std::string& space, const std::optional<std::string>& parent,
                   const std::string& name, Node& out);

    // `base` if no live sibling uses it, else "stem (N).ext" with the
    // smallest free N >= 2.
    int dedupe_name(const std::string& space, const std::optional<std::string>& parent,
                    const std::string& base, std::string& out);

    int import(const std::string& space, const Attachment& att, Timestamp received,
               ImportedNode& out,
               const std::optional<std::string>& agent = std::nullopt);

    // Failed items are logged and skipped.
    std::vector<ImportedNode> import_all(const std::string& space,
                                         const std::vector<Attachment>& atts,
                                         Timestamp received,
                                         const std::optional<std::string>& agent = std::nullopt);

  private:
    NodeStore& store_;
    bool debug_;
};

// UTC calendar date of `ts` as YYYY-MM-DD.
std::string utc_date(Timestamp ts);

}

#endif

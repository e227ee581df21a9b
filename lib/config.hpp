#ifndef INCLUDE_AGENTFS_CONFIG_
#define INCLUDE_AGENTFS_CONFIG_

#include <string>

namespace agentfs {

class Config {
  public:
    Config();
    Config(const std::string& file);
    ~Config();
    const std::string& metadata() const;
    const std::string& pool() const;
    const std::string& remote() const;
    bool debug() const;

  private:
    std::string metadata_;
    std::string pool_;
    std::string remote_;
    bool debug_ = false;
};

}

#endif

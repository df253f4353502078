#include "message_table.hpp"

#include <algorithm>

namespace minder {
namespace messages {

std::string kind_of(const google::protobuf::Any &msg) {
    const std::string &url = msg.type_url();
    auto slash = url.rfind('/');
    if (slash == std::string::npos) {
        return url;
    }
    return url.substr(slash + 1);
}

void MessageTable::add(const std::string &kind, Callback callback) { table_[kind] = std::move(callback); }

std::vector<std::string> MessageTable::kinds() const {
    std::vector<std::string> result;
    result.reserve(table_.size());
    for (const auto &[kind, _] : table_) {
        result.push_back(kind);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool MessageTable::dispatch(const google::protobuf::Any &msg) const {
    auto it = table_.find(kind_of(msg));
    if (it == table_.end()) {
        return false;
    }
    it->second(msg);
    return true;
}

}  // namespace messages
}  // namespace minder

#pragma once

#include <google/protobuf/any.pb.h>

#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace minder {
namespace messages {

// Message kind of a packed application message: its fully-qualified protobuf
// type name, e.g. "minder.echo.v1.EchoRequest". Empty if the type URL is empty.
std::string kind_of(const google::protobuf::Any &msg);

// MessageTable maps a message kind to the callback that handles it.
// Tables are filled in by their owner at construction time and are not
// modified while messages are being dispatched.
class MessageTable {
public:
    using Callback = std::function<void(const google::protobuf::Any &)>;

    // Register a raw callback for a kind. Replaces any existing entry.
    void add(const std::string &kind, Callback callback);

    // Register a typed callback; the Any is unpacked into T before the call.
    template <typename T>
    void on(std::function<void(const T &)> callback) {
        const std::string kind = T::descriptor()->full_name();
        add(kind, [kind, callback](const google::protobuf::Any &any) {
            T msg;
            if (!any.UnpackTo(&msg)) {
                throw std::runtime_error("Failed to unpack message of kind " + kind);
            }
            callback(msg);
        });
    }

    bool contains(const std::string &kind) const { return table_.count(kind) != 0; }
    size_t size() const { return table_.size(); }
    std::vector<std::string> kinds() const;

    // Dispatch msg to the callback registered for its kind.
    // Returns false if there is none. Exceptions thrown by the callback propagate.
    bool dispatch(const google::protobuf::Any &msg) const;

private:
    std::unordered_map<std::string, Callback> table_;
};

}  // namespace messages
}  // namespace minder

#include "objio/uri.hpp"

namespace objio {

URI::URI(const std::string& str) {
    *this = parse(str);
}

URI URI::parse(const std::string& str) {
    URI uri;

    if (str.empty()) {
        return uri;
    }

    if (str[0] != '@') {
        // No routing prefix - plain path for the default transport
        uri.key_ = str;
        return uri;
    }

    // Transport name ends at ':' (container follows) or '/' (key follows)
    size_t colon_pos = str.find(':');
    size_t slash_pos = str.find('/');

    if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos)) {
        // @transport:container/key
        uri.transport_ = str.substr(0, colon_pos);
        if (slash_pos != std::string::npos) {
            uri.container_ = str.substr(colon_pos + 1, slash_pos - colon_pos - 1);
            uri.key_ = str.substr(slash_pos + 1);
        } else {
            // @transport:container with no key
            uri.container_ = str.substr(colon_pos + 1);
        }
    } else if (slash_pos != std::string::npos) {
        // @transport/key
        uri.transport_ = str.substr(0, slash_pos);
        uri.key_ = str.substr(slash_pos + 1);
    } else {
        // Just @transport
        uri.transport_ = str;
    }

    return uri;
}

bool URI::is_relative() const {
    if (routed()) {
        return true;  // Routed keys are resolved by their transport
    }
    return !key_.empty() && key_[0] != '/';
}

bool URI::is_absolute() const {
    return !is_relative();
}

std::string URI::transport_name() const {
    if (transport_.empty()) {
        return {};
    }
    return transport_.substr(1);
}

std::string URI::to_string() const {
    if (transport_.empty()) {
        return key_;
    }

    std::string result = transport_;
    if (!container_.empty()) {
        result += ":" + container_;
    }
    if (!key_.empty()) {
        result += "/" + key_;
    }
    return result;
}

} // namespace objio

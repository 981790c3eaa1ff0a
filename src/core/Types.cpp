#include "chunkswarm/Types.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace chunkswarm {

namespace {
constexpr std::size_t kContentHashLength = 40;
}

std::string endpoint_to_string(const PeerEndpoint& endpoint) {
    return endpoint.ip + ":" + std::to_string(endpoint.port);
}

std::optional<PeerEndpoint> endpoint_from_string(const std::string& text) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
        return std::nullopt;
    }
    const auto port_text = text.substr(pos + 1);
    unsigned int port = 0;
    const auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (result.ec != std::errc{} || result.ptr != port_text.data() + port_text.size() || port > 65535) {
        return std::nullopt;
    }
    PeerEndpoint endpoint{};
    endpoint.ip = text.substr(0, pos);
    endpoint.port = static_cast<std::uint16_t>(port);
    return endpoint;
}

std::string bytes_to_hex(const std::uint8_t* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (std::size_t index = 0; index < length; ++index) {
        oss << std::setw(2) << static_cast<int>(data[index]);
    }
    return oss.str();
}

bool is_content_hash(const std::string& text) {
    if (text.size() != kContentHashLength) {
        return false;
    }
    for (const unsigned char ch : text) {
        if (std::isxdigit(ch) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkswarm

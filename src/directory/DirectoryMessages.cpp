#include "chunkswarm/directory/DirectoryMessages.hpp"

#include "chunkswarm/core/ChunkCodec.hpp"

#include <limits>
#include <optional>

namespace chunkswarm::directory {

namespace {

json::Value encode_chunks(const std::vector<ChunkIndex>& chunks) {
    auto array = json::Value::array();
    for (const auto chunk : chunks) {
        array.push_back(json::Value::number(static_cast<double>(chunk)));
    }
    return array;
}

std::optional<std::uint16_t> decode_port(const json::Value& value) {
    const auto port = value.as_unsigned();
    if (!port.has_value() || *port == 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*port);
}

// Entries that are not chunk ids are dropped; availability indexing treats them as out of range.
std::vector<ChunkIndex> decode_chunks(const json::Value& value) {
    std::vector<ChunkIndex> chunks;
    chunks.reserve(value.array_value.size());
    for (const auto& item : value.array_value) {
        const auto chunk = item.as_unsigned();
        if (chunk.has_value() && *chunk <= std::numeric_limits<ChunkIndex>::max()) {
            chunks.push_back(static_cast<ChunkIndex>(*chunk));
        }
    }
    return chunks;
}

json::Value encode_peer(const PeerAdvertisement& peer) {
    auto object = json::Value::object();
    object.set("ip", json::Value::string(peer.endpoint.ip));
    object.set("port", json::Value::number(peer.endpoint.port));
    object.set("chunks", encode_chunks(peer.chunks));
    return object;
}

std::string string_field(const json::Value& body, const char* key) {
    const auto* value = body.find(key);
    return value != nullptr && value->is_string() ? value->string_value : std::string{};
}

}  // namespace

json::Value encode_registration(const FileDescriptor& file, const PeerAdvertisement& peer) {
    auto body = json::Value::object();
    body.set("file_name", json::Value::string(file.name));
    body.set("file_hash", json::Value::string(file.content_hash));
    body.set("file_size", json::Value::number(static_cast<double>(file.size)));
    body.set("chunks", encode_chunks(peer.chunks));
    body.set("ip", json::Value::string(peer.endpoint.ip));
    body.set("port", json::Value::number(peer.endpoint.port));
    return body;
}

bool decode_registration(const json::Value& body, FileDescriptor& file, PeerAdvertisement& peer, std::string& error) {
    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }
    for (const char* field : {"file_name", "file_hash", "file_size", "chunks", "ip", "port"}) {
        if (body.find(field) == nullptr) {
            error = std::string("Missing field: ") + field;
            return false;
        }
    }

    const auto& name = *body.find("file_name");
    const auto& hash = *body.find("file_hash");
    const auto size = body.find("file_size")->as_unsigned();
    const auto& chunks = *body.find("chunks");
    const auto& ip = *body.find("ip");
    const auto port = decode_port(*body.find("port"));

    const char* invalid = nullptr;
    if (!name.is_string() || name.string_value.empty()) {
        invalid = "file_name";
    } else if (!hash.is_string() || !is_content_hash(hash.string_value)) {
        invalid = "file_hash";
    } else if (!size.has_value()) {
        invalid = "file_size";
    } else if (!chunks.is_array()) {
        invalid = "chunks";
    } else if (!ip.is_string() || ip.string_value.empty()) {
        invalid = "ip";
    } else if (!port.has_value()) {
        invalid = "port";
    }
    if (invalid != nullptr) {
        error = std::string("Invalid field: ") + invalid;
        return false;
    }

    file.name = name.string_value;
    file.content_hash = hash.string_value;
    file.size = *size;
    file.chunk_count = chunk_count(file.size);
    peer.endpoint = PeerEndpoint{ip.string_value, *port};
    peer.chunks = decode_chunks(chunks);
    return true;
}

json::Value encode_registration_result(const RegistrationResult& result, const std::string& content_hash) {
    auto body = json::Value::object();
    body.set("message", json::Value::string(result.message));
    body.set("file_hash", json::Value::string(content_hash));
    body.set("peers_count", json::Value::number(static_cast<double>(result.peers_count)));
    return body;
}

RegistrationResult decode_registration_result(const json::Value& body) {
    RegistrationResult result{};
    result.message = string_field(body, "message");
    result.updated = result.message.find("updated") != std::string::npos;
    if (const auto* count = body.find("peers_count"); count != nullptr) {
        result.peers_count = static_cast<std::size_t>(count->as_unsigned().value_or(0));
    }
    return result;
}

json::Value encode_lookup(const LookupResult& lookup) {
    auto body = json::Value::object();
    body.set("file_hash", json::Value::string(lookup.file.content_hash));
    body.set("file_name", json::Value::string(lookup.file.name));
    body.set("file_size", json::Value::number(static_cast<double>(lookup.file.size)));
    auto peers = json::Value::array();
    for (const auto& peer : lookup.peers) {
        peers.push_back(encode_peer(peer));
    }
    body.set("peers", std::move(peers));
    return body;
}

LookupResult decode_lookup(const json::Value& body) {
    if (!body.is_object()) {
        throw DirectoryError("Lookup reply is not a JSON object");
    }
    const auto* size = body.find("file_size");
    if (size == nullptr || !size->as_unsigned().has_value()) {
        throw DirectoryError("Lookup reply lacks a valid file_size");
    }

    LookupResult lookup{};
    lookup.file.name = string_field(body, "file_name");
    lookup.file.content_hash = string_field(body, "file_hash");
    lookup.file.size = *size->as_unsigned();
    lookup.file.chunk_count = chunk_count(lookup.file.size);

    const auto* peers = body.find("peers");
    if (peers == nullptr) {
        return lookup;
    }
    if (!peers->is_array()) {
        throw DirectoryError("Lookup reply has a malformed peers list");
    }
    for (const auto& entry : peers->array_value) {
        const auto* ip = entry.find("ip");
        const auto* port = entry.find("port");
        const auto* chunks = entry.find("chunks");
        if (ip == nullptr || !ip->is_string() || port == nullptr || !decode_port(*port).has_value()) {
            throw DirectoryError("Lookup reply has a peer without a usable ip and port");
        }
        PeerAdvertisement peer{};
        peer.endpoint = PeerEndpoint{ip->string_value, *decode_port(*port)};
        if (chunks != nullptr && chunks->is_array()) {
            peer.chunks = decode_chunks(*chunks);
        }
        lookup.peers.push_back(std::move(peer));
    }
    return lookup;
}

json::Value encode_file_list(const std::vector<FileSummary>& files) {
    auto list = json::Value::array();
    for (const auto& summary : files) {
        auto entry = json::Value::object();
        entry.set("file_hash", json::Value::string(summary.file.content_hash));
        entry.set("file_name", json::Value::string(summary.file.name));
        entry.set("file_size", json::Value::number(static_cast<double>(summary.file.size)));
        entry.set("peers_count", json::Value::number(static_cast<double>(summary.peers_count)));
        list.push_back(std::move(entry));
    }
    auto body = json::Value::object();
    body.set("files", std::move(list));
    return body;
}

std::vector<FileSummary> decode_file_list(const json::Value& body) {
    const auto* files = body.find("files");
    if (files == nullptr || !files->is_array()) {
        throw DirectoryError("File list reply lacks a files array");
    }
    std::vector<FileSummary> result;
    for (const auto& entry : files->array_value) {
        FileSummary summary{};
        summary.file.name = string_field(entry, "file_name");
        summary.file.content_hash = string_field(entry, "file_hash");
        if (const auto* size = entry.find("file_size"); size != nullptr) {
            summary.file.size = size->as_unsigned().value_or(0);
        }
        summary.file.chunk_count = chunk_count(summary.file.size);
        if (const auto* count = entry.find("peers_count"); count != nullptr) {
            summary.peers_count = static_cast<std::size_t>(count->as_unsigned().value_or(0));
        }
        result.push_back(std::move(summary));
    }
    return result;
}

json::Value encode_error(const std::string& message) {
    auto body = json::Value::object();
    body.set("error", json::Value::string(message));
    return body;
}

}  // namespace chunkswarm::directory

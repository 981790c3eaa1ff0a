#pragma once

#include "chunkswarm/directory/Directory.hpp"
#include "chunkswarm/json/Json.hpp"

#include <string>
#include <vector>

namespace chunkswarm::directory {

// JSON bodies of the directory's HTTP API.

json::Value encode_registration(const FileDescriptor& file, const PeerAdvertisement& peer);
// Fills file and peer from a /register body; on failure error holds the reply text
// ("Missing field: <name>" or "Invalid field: <name>").
bool decode_registration(const json::Value& body, FileDescriptor& file, PeerAdvertisement& peer, std::string& error);

json::Value encode_registration_result(const RegistrationResult& result, const std::string& content_hash);
RegistrationResult decode_registration_result(const json::Value& body);

json::Value encode_lookup(const LookupResult& lookup);
// Throws DirectoryError when the body lacks file_size or a well-formed peers list.
// A missing file_hash yields an empty content_hash; chunk ids that do not fit are skipped.
LookupResult decode_lookup(const json::Value& body);

json::Value encode_file_list(const std::vector<FileSummary>& files);
std::vector<FileSummary> decode_file_list(const json::Value& body);

json::Value encode_error(const std::string& message);

}  // namespace chunkswarm::directory

#include "chunkswarm/directory/HttpDirectoryClient.hpp"

#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryMessages.hpp"
#include "chunkswarm/json/Json.hpp"

#include <curl/curl.h>

#include <utility>

namespace chunkswarm::directory {

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

bool ensure_curl_ready() {
    static const bool ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    return ready;
}

std::string escape_component(const std::string& text) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DirectoryError("Unable to allocate curl handle");
    }
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        throw DirectoryError("Unable to escape " + text);
    }
    std::string result(escaped);
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

json::Value parse_reply(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::ParseError& ex) {
        throw DirectoryError(what + " reply is not valid JSON: " + ex.what());
    }
}

// The directory answers failures with {"error": "..."}; fall back to the raw status.
std::string error_text(long status, const std::string& body) {
    try {
        const auto value = json::parse(body);
        if (const auto* error = value.find("error"); error != nullptr && error->is_string()) {
            return error->string_value + " (HTTP " + std::to_string(status) + ")";
        }
    } catch (const json::ParseError&) {
        // not a JSON error body
    }
    return "HTTP status " + std::to_string(status);
}

}  // namespace

HttpDirectoryClient::HttpDirectoryClient(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpDirectoryClient::HttpReply HttpDirectoryClient::perform(const std::string& path, const std::string* post_body) const {
    if (!ensure_curl_ready()) {
        throw DirectoryError("Unable to initialize libcurl");
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DirectoryError("Unable to allocate curl handle");
    }

    const std::string url = base_url_ + path;
    HttpReply reply{};
    curl_slist* headers = nullptr;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "chunkswarm/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    if (post_body != nullptr) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        daemon::log_event(daemon::StructuredLogger::Level::Warning,
                          "directory.client.transport_failed",
                          {{"url", url}, {"error", curl_easy_strerror(rc)}});
        throw DirectoryError("Directory request to " + url + " failed: " + curl_easy_strerror(rc));
    }
    return reply;
}

RegistrationResult HttpDirectoryClient::register_peer(const FileDescriptor& file, const PeerAdvertisement& peer) {
    const auto body = json::serialize(encode_registration(file, peer));
    const auto reply = perform("/register", &body);
    if (reply.status != 200) {
        throw DirectoryError("Registration rejected: " + error_text(reply.status, reply.body), reply.status);
    }
    return decode_registration_result(parse_reply(reply.body, "Registration"));
}

std::optional<LookupResult> HttpDirectoryClient::lookup(const std::string& file_name) {
    const auto reply = perform("/lookup?file_name=" + escape_component(file_name), nullptr);
    if (reply.status == 404) {
        return std::nullopt;
    }
    if (reply.status != 200) {
        throw DirectoryError("Lookup failed: " + error_text(reply.status, reply.body), reply.status);
    }
    return decode_lookup(parse_reply(reply.body, "Lookup"));
}

std::vector<FileSummary> HttpDirectoryClient::list_files() {
    const auto reply = perform("/files", nullptr);
    if (reply.status != 200) {
        throw DirectoryError("File listing failed: " + error_text(reply.status, reply.body), reply.status);
    }
    return decode_file_list(parse_reply(reply.body, "File listing"));
}

}  // namespace chunkswarm::directory

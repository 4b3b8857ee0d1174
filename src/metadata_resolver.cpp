#include "dsfetch/metadata_resolver.hpp"

#include "dsfetch/backoff.hpp"
#include "dsfetch/cancellation.hpp"
#include "dsfetch/detail/curl_utils.hpp"
#include "dsfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dsfetch {

namespace {

using json = nlohmann::json;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string stringField(const json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return {};
}

struct HttpResponse {
    CURLcode code{CURLE_OK};
    long status{0};
    std::string body;
    std::string error;
};

HttpResponse httpGet(const std::string& url, const TransferConfig& config) {
    HttpResponse response;
    detail::CurlHandle curl = detail::makeCurlHandle();
    if (!curl) {
        response.code = CURLE_FAILED_INIT;
        response.error = "Failed to allocate curl handle";
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config.metadata_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
            if (!out) {
                return 0;
            }
            out->append(ptr, size * nmemb);
            return size * nmemb;
        });
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    response.code = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.code != CURLE_OK) {
        response.error = response.code == CURLE_HTTP_RETURNED_ERROR
            ? fmt::format("HTTP {}", response.status)
            : std::string(curl_easy_strerror(response.code));
    }
    return response;
}

} // namespace

ZenodoResolver::ZenodoResolver(TransferConfig config, Sleeper& sleeper, const CancellationToken& token)
    : config_(std::move(config)), sleeper_(sleeper), token_(token) {}

RecordMetadata ZenodoResolver::resolve(const std::string& record_id) {
    const std::string url = config_.api_base_url + record_id;
    spdlog::info("Fetching metadata: {}", url);

    for (std::size_t attempt = 1;; ++attempt) {
        const HttpResponse response = httpGet(url, config_);
        if (response.code == CURLE_OK) {
            return parseRecordJson(response.body, record_id);
        }

        const ErrorKind kind = response.code == CURLE_HTTP_RETURNED_ERROR
            ? classifyHttpStatus(response.status)
            : detail::classifyCurlError(response.code);
        if (kind != ErrorKind::Retryable || attempt >= config_.metadata_attempts) {
            throw MetadataError(fmt::format("Failed to fetch metadata for record {}: {}",
                                            record_id, response.error));
        }

        const auto delay = config_.backoff.delayFor(attempt);
        spdlog::warn("Metadata request failed ({}/{}): {}, retrying in {} ms",
                     attempt, config_.metadata_attempts, response.error, delay.count());
        if (!sleeper_.sleepFor(delay, token_)) {
            throw MetadataError("Cancelled while fetching metadata");
        }
    }
}

std::optional<std::string> parseRecordId(const std::string& input) {
    const std::string text = trim(input);
    if (!text.empty() && std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return text;
    }

    static const std::regex pattern(R"(zenodo\.org/records?/(\d+))");
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

RecordMetadata parseRecordJson(const std::string& body, const std::string& fallback_record_id) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::parse_error& e) {
        throw MetadataError(std::string("Malformed metadata response: ") + e.what());
    }
    if (!root.is_object()) {
        throw MetadataError("Malformed metadata response: expected an object");
    }

    RecordMetadata record;
    record.record_id = stringField(root, "id");
    if (record.record_id.empty()) {
        record.record_id = fallback_record_id;
    }
    if (const auto meta = root.find("metadata"); meta != root.end()) {
        record.title = stringField(*meta, "title");
    }
    if (record.title.empty()) {
        record.title = "Untitled_Dataset";
    }

    const auto files = root.find("files");
    if (files == root.end() || !files->is_array()) {
        return record;
    }

    for (const auto& entry : *files) {
        FileDescriptor descriptor;
        descriptor.filename = stringField(entry, "key");
        if (descriptor.filename.empty()) {
            descriptor.filename = stringField(entry, "filename");
        }
        if (const auto links = entry.find("links"); entry.is_object() && links != entry.end()) {
            descriptor.url = stringField(*links, "self");
            if (descriptor.url.empty()) {
                descriptor.url = stringField(*links, "content");
            }
        }
        if (descriptor.filename.empty() || descriptor.url.empty()) {
            spdlog::warn("Skipping unparseable file entry: {}", entry.dump());
            continue;
        }

        if (const auto size = entry.find("size"); size != entry.end() && size->is_number_unsigned()) {
            descriptor.size = size->get<std::uint64_t>();
        } else if (size != entry.end() && size->is_number_integer() && size->get<long long>() >= 0) {
            descriptor.size = static_cast<std::uint64_t>(size->get<long long>());
        }
        if (auto checksum = stringField(entry, "checksum"); !checksum.empty()) {
            descriptor.checksum = std::move(checksum);
        }
        record.files.push_back(std::move(descriptor));
    }
    return record;
}

std::string outputDirectoryName(const std::string& record_id, const std::string& title) {
    std::string safe;
    safe.reserve(title.size());
    for (const char c : title) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '-' || c == '_') {
            safe.push_back(c);
        }
    }
    return fmt::format("Zenodo_{}_{}", record_id, trim(safe));
}

} // namespace dsfetch

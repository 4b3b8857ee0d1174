#pragma once

#include "config.hpp"
#include "file_descriptor.hpp"

#include <optional>
#include <string>

namespace dsfetch {

class CancellationToken;
class Sleeper;

class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;

    // Throws MetadataError if the record cannot be resolved.
    [[nodiscard]] virtual RecordMetadata resolve(const std::string& record_id) = 0;
};

class ZenodoResolver final : public MetadataResolver {
public:
    ZenodoResolver(TransferConfig config, Sleeper& sleeper, const CancellationToken& token);

    [[nodiscard]] RecordMetadata resolve(const std::string& record_id) override;

private:
    TransferConfig config_;
    Sleeper& sleeper_;
    const CancellationToken& token_;
};

// "1234567", "https://zenodo.org/record/1234567", "https://zenodo.org/records/1234567".
[[nodiscard]] std::optional<std::string> parseRecordId(const std::string& input);

// Parses a Zenodo records API body. Entries without a name or URL are skipped.
[[nodiscard]] RecordMetadata parseRecordJson(const std::string& body,
                                             const std::string& fallback_record_id);

// "Zenodo_<id>_<title>" with the title reduced to letters, digits, space, '-' and '_'.
[[nodiscard]] std::string outputDirectoryName(const std::string& record_id,
                                              const std::string& title);

} // namespace dsfetch

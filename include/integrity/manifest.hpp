#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace auraseal::integrity {

inline constexpr const char* kManifestFileName = "manifest.json";

// Locations of the primary (data parts) and secondary (parity parts)
// representations of a fault-tolerant component.
struct RecoveryReference {
    std::string primary;
    std::string secondary;
};

struct IntegrityRecord {
    std::string path;
    std::string integrity;
    std::uint64_t size {0};
    std::size_t parts {0};
    std::uint8_t id {0};
    std::size_t parity {0};
    std::optional<RecoveryReference> recovery;
};

RecoveryReference defaultRecoveryReference(std::uint8_t componentId);

// Where the data parts of a record live, with or without a recovery entry.
std::string dataLocation(const IntegrityRecord& record);
std::string parityLocation(const IntegrityRecord& record);

// Immutable after construction; concurrent const access needs no locking.
class Manifest {
public:
    Manifest() = default;

    // Validates every record. Throws MalformedManifestError or
    // MalformedIntegrityStringError.
    static Manifest fromRecords(std::vector<IntegrityRecord> records);
    static Manifest parse(const std::string& json);
    static Manifest load(const std::filesystem::path& path);

    std::string toJson() const;
    void save(const std::filesystem::path& path) const;

    const IntegrityRecord* find(const std::string& path) const noexcept;
    const IntegrityRecord& at(const std::string& path) const;
    const std::vector<IntegrityRecord>& records() const noexcept;
    std::vector<std::string> paths() const;
    std::size_t size() const noexcept;

private:
    std::vector<IntegrityRecord> records_;
    std::map<std::string, std::size_t> index_;
};

} // namespace auraseal::integrity

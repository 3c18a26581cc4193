#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "io/Logger.hpp"
#include "io/ReadStream.hpp"

// Volume settings kept by a metadata store ("Setting" of a dump, "format" segment of a backup).
struct Format {
    std::string name;
    std::string uuid;
    std::string storage;
    std::string bucket;
    std::string secret_key;

    nlohmann::json raw;

    // throws std::invalid_argument if there's no volume name
    static Format from_json(const nlohmann::json& j);
};

struct LoadOption {
    int threads = 10;
    // called with (segment name, items loaded), possibly from several threads at once
    std::function<void(const std::string&, uint64_t)> progress;
};

// The part of a metadata engine that loads backups.
class MetaClient {
    public:
    virtual ~MetaClient() {}

    // nullopt if the store holds no volume yet
    virtual std::optional<Format> load_format() = 0;

    // JSON dump, read to the end
    virtual void load_json(ReadStream& in) = 0;

    // binary container, read by segment offsets
    virtual void load_binary(const std::filesystem::path& fname, const LoadOption& opt) = 0;

    virtual std::string url() const = 0;
};

// picks the implementation by the url scheme, throws std::invalid_argument for unknown ones
std::unique_ptr<MetaClient> new_client(const std::string& url, std::shared_ptr<Logger> logger);

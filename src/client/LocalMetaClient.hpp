#pragma once
#include "MetaClient.hpp"

// Directory-backed store for "local://DIR" urls: one JSON file per segment, format.json for the volume settings.
class LocalMetaClient : public MetaClient {
    public:
    LocalMetaClient(const std::filesystem::path& dir, std::shared_ptr<Logger> logger);

    std::optional<Format> load_format() override;
    void load_json(ReadStream& in) override;
    void load_binary(const std::filesystem::path& fname, const LoadOption& opt) override;
    std::string url() const override { return "local://" + m_dir.string(); }

    const std::filesystem::path& dir() const { return m_dir; }

    private:
    void save(const std::string& fname, const nlohmann::json& value) const;

    std::filesystem::path m_dir;
    std::shared_ptr<Logger> m_logger;
};

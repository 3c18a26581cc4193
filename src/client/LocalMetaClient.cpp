/**
 * @file LocalMetaClient.cpp
 * @brief Directory-backed metadata store.
 *
 * JSON dumps are stored whole as meta.json, with their "Setting" object as
 * format.json. Binary backups are split into one file per segment, loaded by
 * a pool of worker threads; the "format" segment becomes format.json.
 */

#include "LocalMetaClient.hpp"
#include "core/BakFormat.hpp"
#include "io/Writer.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <mutex>
#include <thread>

#define FORMAT_FNAME "format.json"
#define META_FNAME   "meta.json"

Format Format::from_json(const nlohmann::json& j) {
    if( !j.is_object() || !j.contains("Name") || !j["Name"].is_string() || j["Name"].get<std::string>().empty() ){
        throw std::invalid_argument("volume format has no name");
    }
    Format f;
    f.name       = j["Name"].get<std::string>();
    f.uuid       = j.value("UUID", "");
    f.storage    = j.value("Storage", "");
    f.bucket     = j.value("Bucket", "");
    f.secret_key = j.value("SecretKey", "");
    f.raw = j;
    return f;
}

std::unique_ptr<MetaClient> new_client(const std::string& url, std::shared_ptr<Logger> logger) {
    const size_t p = url.find("://");
    if( p == std::string::npos ){
        throw std::invalid_argument(fmt::format("invalid meta url {}: no scheme", remove_password(url)));
    }
    const std::string scheme = url.substr(0, p);
    if( scheme == "local" ){
        const std::string dir = url.substr(p + 3);
        if( dir.empty() ){
            throw std::invalid_argument(fmt::format("invalid meta url {}: no directory", remove_password(url)));
        }
        return std::make_unique<LocalMetaClient>(dir, logger);
    }
    throw std::invalid_argument(fmt::format("unsupported meta engine \"{}\" in {}", scheme, remove_password(url)));
}

LocalMetaClient::LocalMetaClient(const fs::path& dir, std::shared_ptr<Logger> logger) : m_dir(dir), m_logger(std::move(logger)) {
    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if( ec ){
        throw std::runtime_error(fmt::format("create_directories(\"{}\"): {}", m_dir, ec.message()));
    }
}

std::optional<Format> LocalMetaClient::load_format() {
    const fs::path fname = m_dir / FORMAT_FNAME;
    if( !fs::exists(fname) ){
        return std::nullopt;
    }

    std::ifstream f(fname);
    if( !f ){
        throw std::runtime_error(fmt::format("cannot open {}", fname));
    }
    try {
        return Format::from_json(nlohmann::json::parse(f));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("{}: {}", fname, e.what()));
    }
}

void LocalMetaClient::save(const std::string& fname, const nlohmann::json& value) const {
    const std::string text = value.dump(2);
    Writer w(m_dir / fname, Writer::Mode::Exclusive);
    w.write(text.data(), text.size());
    w.close();
}

void LocalMetaClient::load_json(ReadStream& in) {
    buf_t data = in.read_all();
    nlohmann::json dump;
    try {
        dump = nlohmann::json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("invalid metadata dump: {}", e.what()));
    }
    if( !dump.is_object() || !dump.contains("Setting") ){
        throw std::runtime_error("invalid metadata dump: no \"Setting\" object");
    }
    Format format = Format::from_json(dump["Setting"]);
    m_logger->debug("loading volume {} ({}) from JSON dump, {}", format.name, format.uuid, bytes2human(data.size()));

    save(META_FNAME, dump);
    save(FORMAT_FNAME, format.raw);
}

void LocalMetaClient::load_binary(const fs::path& fname, const LoadOption& opt) {
    Reader reader(fname);
    BakInspector inspector(m_logger);
    const BakFooter footer = inspector.read_footer(reader);
    if( !footer.segments.contains("format") ){
        throw std::runtime_error(fmt::format("{}: backup has no format segment", fname));
    }

    std::vector<std::pair<std::string, SegInfo>> work(footer.segments.begin(), footer.segments.end());
    const int nthreads = std::max(1, std::min<int>(opt.threads, work.size()));
    m_logger->debug("loading {} segments from {} on {} threads", work.size(), fname, nthreads);

    std::atomic<size_t> next = 0;
    std::exception_ptr first_error;
    std::mutex error_mtx;

    auto worker = [&]() {
        while( true ){
            {
                std::lock_guard<std::mutex> lock(error_mtx);
                if( first_error ){
                    return;
                }
            }
            const size_t i = next++;
            if( i >= work.size() ){
                return;
            }
            const auto& [name, info] = work[i];
            try {
                Segment seg = inspector.read_segment(reader, info.offset);
                if( seg.name != name ){
                    throw std::runtime_error(fmt::format("{}: index entry \"{}\" points to segment \"{}\"", fname, name, seg.name));
                }
                if( name == "format" ){
                    Format::from_json(seg.value); // throws if there is no volume name
                    save(FORMAT_FNAME, seg.value);
                } else {
                    save(name + ".json", seg.value);
                }
                if( opt.progress ){
                    opt.progress(name, seg.count());
                }
            } catch (const std::exception& e) {
                m_logger->error("failed to load segment {}: {}", name, e.what());
                std::lock_guard<std::mutex> lock(error_mtx);
                if( !first_error ){
                    first_error = std::current_exception();
                }
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(nthreads);
    for( int i = 0; i < nthreads; i++ ){
        threads.emplace_back(worker);
    }
    for( auto& t : threads ){
        t.join();
    }

    if( first_error ){
        std::rethrow_exception(first_error);
    }
}

/**
 * @file LoadCommand.cpp
 * @brief Implementation of the LoadCommand: load a metadata backup into an empty store.
 *
 * Backups may be compressed (.gz, .zstd) and/or encrypted with an RSA-wrapped
 * data key. JSON dumps are streamed through the decode pipeline straight into
 * the store. Binary backups need random access, so they are first decoded to
 * a plain file next to the source, which is reused by later runs. With --stat
 * a binary backup is only inspected: its segment table or a single segment is
 * printed to stdout.
 *
 * Examples:
 *   metaload load local:///var/lib/meta meta-dump.json.gz
 *   metaload load local:///var/lib/meta meta-dump.bin --binary --threads 10
 *   metaload load meta-dump.bin --binary --stat
 */

#include "LoadCommand.hpp"
#include "core/ConversionCache.hpp"
#include "core/KeyLoader.hpp"
#include "core/ReportRenderer.hpp"
#include "core/StreamComposer.hpp"
#include "core/errors.hpp"
#include "io/FileStream.hpp"
#include "io/Reader.hpp"
#include "client/MetaClient.hpp"
#include "utils/Progress.hpp"

#include <iostream>

REGISTER_COMMAND(LoadCommand);

LoadCommand::LoadCommand(bool reg) : Command(reg, "load", "load metadata from a previously dumped JSON or binary backup") {
    m_parser.add_argument("args")
        .nargs(1, 2)
        .metavar("META-URL [FILE]")
        .help("metadata store url and backup file; without FILE the JSON dump is read from STDIN. With --stat: backup file only");

    m_parser.add_argument("--encrypt-rsa-key")
        .default_value(std::string(""))
        .help("RSA private key (PEM text or path to a PEM file) the backup was encrypted with");
    m_parser.add_argument("--encrypt-algo")
        .default_value(std::string("aes256gcm-rsa"))
        .choices("aes256gcm-rsa", "chacha20-rsa")
        .help("encryption algorithm (aes256gcm-rsa, chacha20-rsa)");
    m_parser.add_argument("--binary")
        .default_value(false)
        .implicit_value(true)
        .help("load metadata from a binary backup");
    m_parser.add_argument("--stat")
        .default_value(false)
        .implicit_value(true)
        .help("show the segments of a binary backup, do not load anything");
    m_parser.add_argument("--offset")
        .scan<'i', int64_t>()
        .help("with --stat: print the segment at this offset, -1 = list segment offsets");
    m_parser.add_argument("--threads")
        .default_value(10)
        .scan<'i', int>()
        .help("number of threads loading a binary backup");
}

void LoadCommand::stat_bak(const std::string& path) {
    m_logger->info("load backup from {}", path);

    std::unique_ptr<Reader> reader;
    try {
        reader = std::make_unique<Reader>(path);
    } catch (const std::runtime_error& e) {
        throw SourceNotFoundError(fmt::format("failed to open file {}: {}", path, e.what()));
    }

    BakInspector inspector(m_logger);
    ReportRenderer report(std::cout);

    if( !m_parser.is_used("--offset") ){
        report.summary(inspector.read_footer(*reader), false);
        return;
    }

    const int64_t offset = m_parser.get<int64_t>("--offset");
    if( offset == -1 ){
        report.summary(inspector.read_footer(*reader), true);
        return;
    }
    report.detail(inspector.read_segment(*reader, offset));
}

int LoadCommand::load(const std::vector<std::string>& args) {
    const std::string key = m_parser.get("--encrypt-rsa-key");
    const crypto::Algorithm algo = crypto::parse_algorithm(m_parser.get("--encrypt-algo"));
    const bool binary = m_parser.get<bool>("--binary");
    const bool stat = m_parser.get<bool>("--stat");

    if( stat && !binary ){
        m_logger->error("--stat needs --binary");
        return 1;
    }

    std::string src = args.size() > 1 ? args[1] : "";
    if( binary && stat ){
        src = args[0];
    }

    const DecodeSpec spec = DecodeSpec::from_env(src, key, algo);
    std::unique_ptr<crypto::DataEncryptor> encryptor;
    if( !src.empty() ){
        encryptor = KeyLoader(m_logger).load(spec);
    }

    if( binary ){
        if( src.empty() ){
            m_logger->error("binary backup can't be read from STDIN, give a FILE");
            return 1;
        }
        src = ConversionCache(m_logger).materialize(src, encryptor.get()).string();
        if( stat ){
            stat_bak(src);
            return 0;
        }
    }

    const std::string meta_url = args[0];
    auto client = new_client(meta_url, m_logger);
    if( auto format = client->load_format() ){
        throw std::runtime_error(fmt::format("database {} is used by volume {}", remove_password(meta_url), format->name));
    }

    if( binary ){
        Progress progress(verbosity < 0);
        for( const char* name : Meta::Bak::SEGMENT_NAMES ){
            progress.add_count_spinner(name);
        }

        LoadOption opt;
        opt.threads = m_parser.get<int>("--threads");
        opt.progress = [&](const std::string& name, uint64_t count) {
            if( auto counter = progress.find(name) ){
                counter->incr_by(count);
            } else {
                m_logger->debug("loaded {} items of unknown segment {}", count, name);
            }
        };
        // the plain file was decoded above, read it without the key
        client->load_binary(src, opt);
        progress.done();
    } else {
        std::unique_ptr<ReadStream> in;
        if( src.empty() ){
            in = FileStream::open_stdin();
            src = "STDIN";
        } else {
            in = StreamComposer(m_logger).open(src, encryptor.get());
        }
        client->load_json(*in);
        in->close();
    }

    auto format = client->load_format();
    if( !format ){
        throw std::runtime_error(fmt::format("no volume in {} after loading {}", remove_password(meta_url), src));
    }
    if( format->secret_key == "removed" ){
        m_logger->warn("secret key was removed; please correct it with `config` command");
    }
    m_logger->info("load metadata from {} succeed", src);
    return 0;
}

/**
 * @brief Executes the load command.
 *
 * Errors of the decode pipeline and the container format are reported here;
 * anything else propagates to main().
 *
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) otherwise.
 */
int LoadCommand::run() {
    const auto args = m_parser.get<std::vector<std::string>>("args");
    try {
        return load(args);
    } catch (const BakError& e) {
        m_logger->critical("{}", e.what());
        return 1;
    }
}

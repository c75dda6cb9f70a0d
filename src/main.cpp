#include "dropfile/client_config.hpp"
#include "dropfile/errors.hpp"
#include "dropfile/file_handle.hpp"
#include "dropfile/log.hpp"
#include "dropfile/metrics.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Command {
    const char* name;
    size_t args;
};

const Command COMMANDS[] = {
    {"cat", 1}, {"get", 2}, {"put", 2}, {"ls", 1}, {"stat", 1},
    {"cp", 2}, {"mv", 2}, {"rm", 1}, {"mkdir", 1},
};

const Command* find_command(const std::string& name) {
    for (const auto& cmd : COMMANDS) {
        if (name == cmd.name) return &cmd;
    }
    return nullptr;
}

std::string describe(const dropfile::Metadata& meta) {
    std::string bytes = meta.bytes() ? std::to_string(*meta.bytes()) : "-";
    return std::string(meta.is_dir() ? "d " : "- ") + bytes + "\t" + meta.path();
}

// Stream a remote file into `out` one chunk at a time
void download(dropfile::FileHandle& fh, const std::string& remote, std::ostream& out) {
    fh.open(remote, dropfile::OpenMode::Read);
    while (true) {
        auto data = fh.read(static_cast<size_t>(fh.chunk_size()));
        if (data.empty()) break;
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    fh.close();
}

int run(dropfile::FileHandle& fh, const std::string& command, const std::vector<std::string>& args) {
    if (command == "cat") {
        download(fh, args[0], std::cout);
        std::cout.flush();
    } else if (command == "get") {
        std::ofstream ofs(args[1], std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::cerr << "Error: cannot open " << args[1] << " for writing\n";
            return 1;
        }
        download(fh, args[0], ofs);
        ofs.close();
        if (!ofs.good()) {
            std::cerr << "Error: failed writing " << args[1] << "\n";
            return 1;
        }
        dropfile::log_info("%s -> %s (%llu bytes)", args[0].c_str(), args[1].c_str(),
                           static_cast<unsigned long long>(fh.metadata()->bytes().value_or(0)));
    } else if (command == "put") {
        std::ifstream ifs(args[0], std::ios::binary);
        if (!ifs) {
            std::cerr << "Error: cannot open " << args[0] << "\n";
            return 1;
        }
        fh.open(args[1], dropfile::OpenMode::Write);
        std::vector<char> block(static_cast<size_t>(fh.chunk_size()));
        try {
            while (ifs) {
                ifs.read(block.data(), static_cast<std::streamsize>(block.size()));
                auto n = static_cast<size_t>(ifs.gcount());
                if (n > 0) fh.write(std::string_view(block.data(), n));
            }
        } catch (const dropfile::Error&) {
            // Never commit a prefix over the destination
            fh.abort();
            throw;
        }
        if (ifs.bad()) {
            fh.abort();
            std::cerr << "Error: failed reading " << args[0] << "\n";
            return 1;
        }
        fh.close();
        dropfile::log_info("%s -> %s", args[0].c_str(), describe(*fh.metadata()).c_str());
    } else if (command == "ls") {
        auto entries = fh.contents(args[0]);
        for (const auto& entry : entries.value_or(std::vector<dropfile::Metadata>{})) {
            std::cout << describe(entry) << "\n";
        }
    } else if (command == "stat") {
        fh.contents(args[0]);
        auto raw = fh.metadata()->raw();
        raw.erase("contents");
        std::cout << raw.dump(2) << "\n";
    } else if (command == "cp") {
        dropfile::log_info("%s", describe(fh.copyfile(args[0], args[1])).c_str());
    } else if (command == "mv") {
        dropfile::log_info("%s", describe(fh.movefile(args[0], args[1])).c_str());
    } else if (command == "rm") {
        fh.deletefile(args[0]);
        dropfile::log_info("deleted %s", args[0].c_str());
    } else if (command == "mkdir") {
        dropfile::log_info("%s", describe(fh.createfolder(args[0])).c_str());
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    auto config_opt = dropfile::ClientConfig::from_args(argc, argv, &positional);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    if (positional.empty()) {
        std::cerr << "Error: no command given (see --help)\n";
        return 1;
    }
    const auto* cmd = find_command(positional[0]);
    if (!cmd) {
        std::cerr << "Error: unknown command: " << positional[0] << "\n";
        return 1;
    }
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    if (args.size() != cmd->args) {
        std::cerr << "Error: " << cmd->name << " takes " << cmd->args << " argument(s)\n";
        return 1;
    }

    dropfile::set_verbose(config.verbose);

    std::unique_ptr<dropfile::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<dropfile::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"root", config.root}});
        metrics->start();
    }

    int rc = 0;
    try {
        auto fh = dropfile::FileHandle::create(config, metrics.get());
        rc = run(fh, cmd->name, args);
        if (rc == 0) {
            fh.close();
        } else {
            fh.abort();
        }
    } catch (const dropfile::NotFoundError& e) {
        std::cerr << "Error: not found: " << e.what() << "\n";
        rc = 1;
    } catch (const dropfile::Error& e) {
        std::cerr << "Error (" << dropfile::error_kind_name(e.kind()) << "): " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}

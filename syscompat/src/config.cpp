#include <cstdlib>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "fd_table.hpp"
#include "fs.hpp"
#include "stat.hpp"

using json = nlohmann::json;

namespace
{
    io::Error _invalid_data(const std::string &message)
    {
        return io::Error(io::ErrorKind::InvalidData, message);
    }

    io::Result<std::string> _read_to_string(fs::File &file)
    {
        std::vector<char> buffer(8192);
        std::string content;

        while (true)
        {
            auto bytes_read = SHORT_CIRCUIT(std::string, file.read(std::span<char>(buffer.data(), buffer.size())));
            if (bytes_read == 0)
            {
                break;
            }

            content.append(buffer.data(), bytes_read);
        }

        return io::Result<std::string>::ok(std::move(content));
    }
}

namespace syscompat
{
    path::PathBuf default_config_path()
    {
        const char *home = std::getenv("HOME");
        if (home != nullptr && home[0] != '\0')
        {
            return path::PathBuf(home) / ".config" / "syscompat.json";
        }

        // Fall back to a relative path if HOME is unavailable.
        return path::PathBuf(".config") / "syscompat.json";
    }

    io::Result<Config> parse_config(const std::string &text)
    {
        auto parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object())
        {
            return io::Result<Config>::err(_invalid_data("configuration must be a JSON object"));
        }

        Config config;

        auto root = parsed.find("root");
        if (root == parsed.end() || !root->is_string())
        {
            return io::Result<Config>::err(_invalid_data("\"root\" must be a string"));
        }
        config.root = root->get<std::string>();

        auto cwd = parsed.find("cwd");
        if (cwd != parsed.end())
        {
            if (!cwd->is_string())
            {
                return io::Result<Config>::err(_invalid_data("\"cwd\" must be a string"));
            }
            config.cwd = cwd->get<std::string>();
        }

        if (!path::has_root(config.cwd))
        {
            return io::Result<Config>::err(
                io::Error(io::ErrorKind::InvalidInput, std::format("cwd {} is not absolute", config.cwd)));
        }

        auto log_level = parsed.find("log_level");
        if (log_level != parsed.end())
        {
            auto level = log_level->is_string()
                             ? logging::parse_level(log_level->get<std::string>())
                             : std::nullopt;
            if (!level.has_value())
            {
                return io::Result<Config>::err(_invalid_data("\"log_level\" must be one of off, error, warn, info, debug, trace"));
            }
            config.log_level = *level;
        }

        auto descriptors = parsed.value("descriptors", json::array());
        if (!descriptors.is_array())
        {
            return io::Result<Config>::err(_invalid_data("\"descriptors\" must be an array"));
        }

        for (const auto &item : descriptors)
        {
            if (!item.is_object() ||
                !item.contains("fd") || !item["fd"].is_number_integer() ||
                !item.contains("path") || !item["path"].is_string())
            {
                return io::Result<Config>::err(_invalid_data("descriptor entries need an integer \"fd\" and a string \"path\""));
            }

            auto fd = item["fd"].get<int64_t>();
            if (fd < 0 || fd >= FILE_LIMIT)
            {
                return io::Result<Config>::err(
                    io::Error(io::ErrorKind::InvalidInput, std::format("descriptor {} is outside [0, {})", fd, FILE_LIMIT)));
            }

            DescriptorEntry entry;
            entry.fd = static_cast<int>(fd);
            entry.path = item["path"].get<std::string>();

            if (!path::has_root(entry.path))
            {
                return io::Result<Config>::err(
                    io::Error(io::ErrorKind::InvalidInput, std::format("descriptor path {} is not absolute", entry.path)));
            }

            config.descriptors.push_back(std::move(entry));
        }

        return io::Result<Config>::ok(std::move(config));
    }

    io::Result<Config> load_config(const path::PathBuf &path)
    {
        auto file = SHORT_CIRCUIT(Config, fs::File::open(path));
        auto text = SHORT_CIRCUIT(Config, _read_to_string(file));
        return parse_config(text);
    }

    io::Result<std::unique_ptr<ProcessContext>> build_context(const Config &config)
    {
        auto filesystem = std::make_shared<vfs::HostFileSystem>(path::PathBuf(config.root));
        auto context = std::make_unique<ProcessContext>(filesystem, path::PathBuf(config.cwd).lexically_normal());

        for (const auto &entry : config.descriptors)
        {
            auto object = SHORT_CIRCUIT(
                std::unique_ptr<ProcessContext>,
                open_and_classify(*filesystem, path::PathBuf(entry.path).lexically_normal()));

            std::shared_ptr<vfs::FileLike> file = std::visit(
                [](auto &handle) -> std::shared_ptr<vfs::FileLike>
                { return std::move(handle); },
                object);

            SHORT_CIRCUIT(std::unique_ptr<ProcessContext>, context->fd_table().add_at(entry.fd, std::move(file)));
            logging::info("opened {} at descriptor {}", entry.path, entry.fd);
        }

        return io::Result<std::unique_ptr<ProcessContext>>::ok(std::move(context));
    }
}

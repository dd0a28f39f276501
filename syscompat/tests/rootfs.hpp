#pragma once

#include "context.hpp"
#include "environment.hpp"

/**
 * @brief A fixture mounting a fresh host directory as `/`.
 *
 * Layout:
 * - `/hello.txt`
 * - `/a/b/subdir/file.txt`
 * - `/a/b/empty/`
 * - `/home/user/notes.txt`
 */
class RootFsTest : public testing::Test
{
protected:
    path::PathBuf root;
    std::shared_ptr<syscompat::vfs::HostFileSystem> filesystem;
    std::unique_ptr<syscompat::ProcessContext> context;

    void SetUp() override
    {
        const auto *info = testing::UnitTest::GetInstance()->current_test_info();
        root = BASE_TEST_DIR / std::format("{}.{}", info->test_suite_name(), info->name());

        write_fixture(root / "hello.txt", "Hello World!");
        write_fixture(root / "a" / "b" / "subdir" / "file.txt", "nested contents");
        write_fixture(root / "home" / "user" / "notes.txt", "notes");
        ASSERT_TRUE(fs::create_dir_all(root / "a" / "b" / "empty").is_ok());

        filesystem = std::make_shared<syscompat::vfs::HostFileSystem>(path::PathBuf(root));
        context = std::make_unique<syscompat::ProcessContext>(filesystem, path::PathBuf("/home/user"));
    }

    /** @brief Opens the directory at `path` and installs it in the descriptor table. */
    int open_dir_fd(const path::PathBuf &path)
    {
        fs::OpenOptions options;
        options.read(true);

        auto dir = filesystem->open_dir(path, options);
        if (dir.is_err())
        {
            throw std::runtime_error(dir.unwrap_err().message());
        }

        auto fd = context->fd_table().add(std::shared_ptr<syscompat::vfs::FileLike>(std::move(dir).into_ok()));
        return fd.unwrap();
    }

    /** @brief Opens the regular file at `path` and installs it in the descriptor table. */
    int open_file_fd(const path::PathBuf &path)
    {
        fs::OpenOptions options;
        options.read(true);

        auto file = filesystem->open_file(path, options);
        if (file.is_err())
        {
            throw std::runtime_error(file.unwrap_err().message());
        }

        auto fd = context->fd_table().add(std::shared_ptr<syscompat::vfs::FileLike>(std::move(file).into_ok()));
        return fd.unwrap();
    }

    /** @brief Host `stat` of a path below the mounted root. */
    struct stat host_stat(const path::PathBuf &relative) const
    {
        struct stat st = {};
        if (::stat((root / relative).c_str(), &st) != 0)
        {
            throw std::runtime_error(std::format("stat {} failed", relative.string()));
        }

        return st;
    }
};

#pragma once

#include "fs.hpp"
#include "kstat.hpp"

namespace syscompat::vfs
{
    /**
     * @brief Anything a file descriptor can refer to.
     *
     * Files, directories and other descriptor table entries all produce metadata the same way.
     */
    class FileLike
    {
    public:
        virtual ~FileLike() = default;

        virtual io::Result<Kstat> stat() const = 0;
    };

    /** @brief An open regular file together with the absolute path it was opened by. */
    class File : public NonConstructible, public FileLike
    {
    private:
        fs::File _inner;
        path::PathBuf _path;

    public:
        explicit File(fs::File &&inner, path::PathBuf &&path);

        const path::PathBuf &path() const noexcept;
        io::Result<Kstat> stat() const override;
    };

    /**
     * @brief An open directory together with the absolute path it was opened by.
     *
     * The path is the base that descriptor-relative lookups are joined onto.
     */
    class Directory : public NonConstructible, public FileLike
    {
    private:
        fs::Directory _inner;
        path::PathBuf _path;

    public:
        explicit Directory(fs::Directory &&inner, path::PathBuf &&path);

        const path::PathBuf &path() const noexcept;
        io::Result<Kstat> stat() const override;
    };

    /**
     * @brief Opens filesystem objects by absolute path.
     *
     * Opening is kind-specific: @ref open_file fails with @ref io::ErrorKind::IsADirectory on a directory,
     * @ref open_dir fails with @ref io::ErrorKind::NotADirectory on anything else.
     */
    class FileSystem
    {
    public:
        virtual ~FileSystem() = default;

        virtual io::Result<std::unique_ptr<File>> open_file(const path::PathBuf &path, const fs::OpenOptions &options) = 0;
        virtual io::Result<std::unique_ptr<Directory>> open_dir(const path::PathBuf &path, const fs::OpenOptions &options) = 0;
    };

    /**
     * @brief A @ref FileSystem whose `/` is a directory of the host.
     *
     * Paths are normalized lexically before they are mapped, so a `..` component never leaves the root.
     * Symbolic links are resolved by the host: a link below the root may still point outside it.
     */
    class HostFileSystem : public NonConstructible, public FileSystem
    {
    private:
        path::PathBuf _root;

        path::PathBuf _host_path(const path::PathBuf &path) const;

    public:
        explicit HostFileSystem(path::PathBuf &&root);

        io::Result<std::unique_ptr<File>> open_file(const path::PathBuf &path, const fs::OpenOptions &options) override;
        io::Result<std::unique_ptr<Directory>> open_dir(const path::PathBuf &path, const fs::OpenOptions &options) override;
    };
}

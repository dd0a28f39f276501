#include "kstat.hpp"

namespace
{
    struct timespec _timespec(int64_t sec, int64_t nsec)
    {
        struct timespec ts = {};
        ts.tv_sec = sec;
        ts.tv_nsec = nsec;
        return ts;
    }

    syscompat::abi::StatxTimestamp _statx_timestamp(const struct timespec &ts)
    {
        syscompat::abi::StatxTimestamp result = {};
        result.tv_sec = ts.tv_sec;
        result.tv_nsec = static_cast<uint32_t>(ts.tv_nsec);
        return result;
    }
}

namespace syscompat
{
    Kstat Kstat::from_metadata(const fs::Metadata &metadata)
    {
        Kstat kstat;
        kstat.dev = metadata.dev();
        kstat.ino = metadata.ino();
        kstat.mode = metadata.mode();
        kstat.nlink = static_cast<uint32_t>(metadata.nlink());
        kstat.uid = metadata.uid();
        kstat.gid = metadata.gid();
        kstat.rdev = metadata.rdev();
        kstat.size = metadata.len();
        kstat.blksize = static_cast<uint32_t>(metadata.blksize());
        kstat.blocks = metadata.blocks();
        kstat.atime = _timespec(metadata.atime(), metadata.atime_nsec());
        kstat.mtime = _timespec(metadata.mtime(), metadata.mtime_nsec());
        kstat.ctime = _timespec(metadata.ctime(), metadata.ctime_nsec());
        return kstat;
    }

    abi::Stat Kstat::to_stat() const
    {
        abi::Stat st = {};
        st.st_dev = dev;
        st.st_ino = ino;
        st.st_nlink = nlink;
        st.st_mode = mode;
        st.st_uid = uid;
        st.st_gid = gid;
        st.st_rdev = rdev;
        st.st_size = static_cast<int64_t>(size);
        st.st_blksize = blksize;
        st.st_blocks = static_cast<int64_t>(blocks);
        st.st_atime_sec = atime.tv_sec;
        st.st_atime_nsec = atime.tv_nsec;
        st.st_mtime_sec = mtime.tv_sec;
        st.st_mtime_nsec = mtime.tv_nsec;
        st.st_ctime_sec = ctime.tv_sec;
        st.st_ctime_nsec = ctime.tv_nsec;
        return st;
    }

    abi::Statx Kstat::to_statx() const
    {
        abi::Statx stx = {};
        stx.stx_blksize = blksize;
        stx.stx_nlink = nlink;
        stx.stx_uid = uid;
        stx.stx_gid = gid;
        stx.stx_mode = static_cast<uint16_t>(mode);
        stx.stx_ino = ino;
        stx.stx_size = size;
        stx.stx_blocks = blocks;
        stx.stx_atime = _statx_timestamp(atime);
        stx.stx_ctime = _statx_timestamp(ctime);
        stx.stx_mtime = _statx_timestamp(mtime);
        stx.stx_rdev_major = major(rdev);
        stx.stx_rdev_minor = minor(rdev);
        stx.stx_dev_major = major(dev);
        stx.stx_dev_minor = minor(dev);
        return stx;
    }
}

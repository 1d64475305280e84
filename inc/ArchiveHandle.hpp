#ifndef _ARCHIVE_HANDLE_HPP_
#define _ARCHIVE_HANDLE_HPP_

#include "PCH.h"

struct archive;

struct ArchiveMember
{
    std::string name;
    std::uint64_t size = 0; // 解压后大小
    bool isDir = false;
};

/**
 * @class ArchiveHandle
 * @brief 一个已打开的 ZIP 读取器 (libarchive)
 *
 * 成员表在 open() 时一次性读出，此后只读，可被多个线程同时查询。
 * libarchive 的读取器不可重入，所以 readMember() 在句柄内部串行执行。
 * 读取器是顺序流：向后读直接前进，读取当前位置之前的成员时重新打开。
 * 句柄以 shared_ptr 共享，最后一个引用释放时才真正关闭。
 */
class ArchiveHandle
{
public:
    /**
     * @brief 打开压缩包并读取成员表
     * @throw ArkviewError ArchiveNotFound / ArchivePermissionDenied / ArchiveCorrupt
     */
    static std::shared_ptr<ArchiveHandle> open(const fs::path &path);

private:
    // 只有 open() 能构造出它，外部无法绕过 open()
    struct OpenTag
    {
        explicit OpenTag() = default;
    };

public:
    ArchiveHandle(OpenTag, std::string path);
    ~ArchiveHandle();

    ArchiveHandle(const ArchiveHandle &) = delete;
    ArchiveHandle &operator=(const ArchiveHandle &) = delete;

    const std::string &path() const
    {
        return m_path;
    }

    // 按压缩包内顺序排列的全部条目 (含目录)
    const std::vector<ArchiveMember> &members() const
    {
        return m_members;
    }

    std::optional<ArchiveMember> findMember(const std::string &name) const;

    std::uint64_t fileSize() const
    {
        return m_fileSize;
    }
    fs::file_time_type modTime() const
    {
        return m_modTime;
    }

    /**
     * @brief 读出一个成员的全部字节
     * 声明大小为 0 -> MemberEmpty；超过 maxBytes -> MemberTooLarge（读之前判断）。
     * 实际解压出的字节超过 maxBytes 同样视为 MemberTooLarge，绝不截断。
     * @throw ArkviewError
     */
    std::vector<std::uint8_t> readMember(const std::string &name, std::size_t maxBytes);

    // 诊断用：已经重新打开读取器的次数
    std::size_t reopenCount() const
    {
        return m_reopenCount.load();
    }

private:

    struct ArchiveDeleter
    {
        void operator()(struct archive *a) const;
    };
    using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

    static ArchivePtr openReader(const std::string &path);
    void listMembers();
    std::vector<std::uint8_t> readCurrentData(const std::string &name, std::uint64_t declaredSize, std::size_t maxBytes);

    std::string m_path;
    std::uint64_t m_fileSize = 0;
    fs::file_time_type m_modTime{};

    std::vector<ArchiveMember> m_members;
    std::unordered_map<std::string, std::size_t> m_index;

    std::mutex m_readMutex;
    ArchivePtr m_reader;
    std::size_t m_cursor = 0; // 下一个将被读到的条目序号
    std::atomic<std::size_t> m_reopenCount{0};
};

#endif

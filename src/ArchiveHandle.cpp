#include "ArchiveHandle.hpp"
#include "LoadError.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <cerrno>

namespace
{

constexpr std::size_t K_READ_BLOCK = 10240;
constexpr std::size_t K_CHUNK = 64 * 1024;

std::string entryName(struct archive_entry *entry)
{
    const char *utf8 = archive_entry_pathname_utf8(entry);
    if (utf8)
        return utf8;
    const char *raw = archive_entry_pathname(entry);
    return raw ? raw : "";
}

} // namespace

void ArchiveHandle::ArchiveDeleter::operator()(struct archive *a) const
{
    if (a)
        archive_read_free(a);
}

ArchiveHandle::ArchiveHandle(OpenTag, std::string path) : m_path(std::move(path))
{
}

ArchiveHandle::~ArchiveHandle()
{
    spdlog::debug("[ArchiveHandle] Closing {}", m_path);
}

ArchiveHandle::ArchivePtr ArchiveHandle::openReader(const std::string &path)
{
    ArchivePtr reader(archive_read_new());
    if (!reader)
        throw ArkviewError(LoadErrorKind::OutOfMemory, "archive_read_new failed");

    archive_read_support_format_zip(reader.get());
    archive_read_set_options(reader.get(), "hdrcharset=UTF-8");

    if (archive_read_open_filename(reader.get(), path.c_str(), K_READ_BLOCK) != ARCHIVE_OK)
    {
        const int err = archive_errno(reader.get());
        const char *msg = archive_error_string(reader.get());
        std::string detail = msg ? msg : "unknown error";
        if (err == EACCES || err == EPERM)
            throw ArkviewError(LoadErrorKind::ArchivePermissionDenied, "Permission denied: " + path);
        if (err == ENOENT)
            throw ArkviewError(LoadErrorKind::ArchiveNotFound, "File not found: " + path);
        throw ArkviewError(LoadErrorKind::ArchiveCorrupt, "Not a valid ZIP (" + detail + "): " + path);
    }
    return reader;
}

std::shared_ptr<ArchiveHandle> ArchiveHandle::open(const fs::path &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw ArkviewError(LoadErrorKind::ArchiveNotFound, "File not found: " + path.string());
    if (!fs::is_regular_file(path, ec))
        throw ArkviewError(LoadErrorKind::ArchiveCorrupt, "Not a regular file: " + path.string());

    auto handle = std::make_shared<ArchiveHandle>(OpenTag{}, path.string());
    handle->m_fileSize = fs::file_size(path, ec);
    handle->m_modTime = fs::last_write_time(path, ec);
    handle->listMembers();

    spdlog::debug("[ArchiveHandle] Opened {} ({} entries)", handle->m_path, handle->m_members.size());
    return handle;
}

void ArchiveHandle::listMembers()
{
    ArchivePtr reader = openReader(m_path);

    struct archive_entry *entry = nullptr;
    for (;;)
    {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r < ARCHIVE_WARN)
        {
            const char *msg = archive_error_string(reader.get());
            throw ArkviewError(LoadErrorKind::ArchiveCorrupt,
                               std::string("Bad ZIP file (") + (msg ? msg : "header error") + "): " + m_path);
        }

        ArchiveMember member;
        member.name = entryName(entry);
        member.isDir = archive_entry_filetype(entry) == AE_IFDIR || (!member.name.empty() && member.name.back() == '/');
        member.size = archive_entry_size_is_set(entry) ? static_cast<std::uint64_t>(archive_entry_size(entry)) : 0;

        m_index.try_emplace(member.name, m_members.size());
        m_members.push_back(std::move(member));

        archive_read_data_skip(reader.get());
    }
}

std::optional<ArchiveMember> ArchiveHandle::findMember(const std::string &name) const
{
    auto it = m_index.find(name);
    if (it == m_index.end())
        return std::nullopt;
    return m_members[it->second];
}

std::vector<std::uint8_t> ArchiveHandle::readMember(const std::string &name, std::size_t maxBytes)
{
    auto it = m_index.find(name);
    if (it == m_index.end() || m_members[it->second].isDir)
        throw ArkviewError(LoadErrorKind::MemberNotFound, "Member '" + name + "' not found");

    const std::size_t target = it->second;
    const ArchiveMember &member = m_members[target];

    // 读之前先按声明大小检查
    if (member.size == 0)
        throw ArkviewError(LoadErrorKind::MemberEmpty, "Image file empty: " + name);
    if (member.size > maxBytes)
        throw ArkviewError(LoadErrorKind::MemberTooLarge,
                           "Too large (" + std::to_string(member.size) + " > " + std::to_string(maxBytes) + "): " + name);

    std::lock_guard<std::mutex> lock(m_readMutex);

    if (!m_reader || target < m_cursor)
    {
        if (m_reader)
            ++m_reopenCount;
        m_reader.reset();
        m_cursor = 0;
        m_reader = openReader(m_path);
    }

    try
    {
        struct archive_entry *entry = nullptr;
        while (m_cursor <= target)
        {
            int r = archive_read_next_header(m_reader.get(), &entry);
            if (r == ARCHIVE_EOF)
                break;
            if (r < ARCHIVE_WARN)
                throw ArkviewError(LoadErrorKind::ArchiveCorrupt, "Bad ZIP header while seeking " + name);

            const std::size_t current = m_cursor++;
            if (current == target && entryName(entry) == name)
                return readCurrentData(name, member.size, maxBytes);

            archive_read_data_skip(m_reader.get());
        }
    }
    catch (...)
    {
        // 流状态未知，下次重新打开
        m_reader.reset();
        m_cursor = 0;
        throw;
    }

    m_reader.reset();
    m_cursor = 0;
    throw ArkviewError(LoadErrorKind::MemberNotFound, "Member '" + name + "' not found");
}

std::vector<std::uint8_t> ArchiveHandle::readCurrentData(const std::string &name, std::uint64_t declaredSize, std::size_t maxBytes)
{
    std::vector<std::uint8_t> data;
    data.reserve(static_cast<std::size_t>(declaredSize));

    std::uint8_t chunk[K_CHUNK];
    for (;;)
    {
        la_ssize_t n = archive_read_data(m_reader.get(), chunk, sizeof(chunk));
        if (n == 0)
            break;
        if (n < 0)
        {
            const char *msg = archive_error_string(m_reader.get());
            throw ArkviewError(LoadErrorKind::ArchiveCorrupt,
                               std::string("Read error (") + (msg ? msg : "data") + "): " + name);
        }
        if (data.size() + static_cast<std::size_t>(n) > maxBytes)
            throw ArkviewError(LoadErrorKind::MemberTooLarge, "Decompressed data exceeds limit: " + name);
        data.insert(data.end(), chunk, chunk + n);
    }

    if (data.empty())
        throw ArkviewError(LoadErrorKind::MemberEmpty, "Image file empty: " + name);
    return data;
}

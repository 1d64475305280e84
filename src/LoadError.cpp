#include "LoadError.hpp"

const char *errorKindName(LoadErrorKind kind)
{
    switch (kind)
    {
    case LoadErrorKind::None:
        return "None";
    case LoadErrorKind::ArchiveNotFound:
        return "ArchiveNotFound";
    case LoadErrorKind::ArchiveCorrupt:
        return "ArchiveCorrupt";
    case LoadErrorKind::ArchivePermissionDenied:
        return "ArchivePermissionDenied";
    case LoadErrorKind::MemberNotFound:
        return "MemberNotFound";
    case LoadErrorKind::MemberEmpty:
        return "MemberEmpty";
    case LoadErrorKind::MemberTooLarge:
        return "MemberTooLarge";
    case LoadErrorKind::UnsupportedFormat:
        return "UnsupportedFormat";
    case LoadErrorKind::DecompressionBomb:
        return "DecompressionBomb";
    case LoadErrorKind::OutOfMemory:
        return "OutOfMemory";
    case LoadErrorKind::InvalidCapacity:
        return "InvalidCapacity";
    case LoadErrorKind::Cancelled:
        return "Cancelled";
    case LoadErrorKind::Internal:
        return "Internal";
    }
    return "Unknown";
}

std::string describeError(LoadErrorKind kind)
{
    switch (kind)
    {
    case LoadErrorKind::None:
        return "";
    case LoadErrorKind::ArchiveNotFound:
        return "Cannot open ZIP: file not found";
    case LoadErrorKind::ArchiveCorrupt:
        return "Cannot open ZIP: not a valid archive";
    case LoadErrorKind::ArchivePermissionDenied:
        return "Cannot open ZIP: permission denied";
    case LoadErrorKind::MemberNotFound:
        return "Image not found in archive";
    case LoadErrorKind::MemberEmpty:
        return "Image file empty";
    case LoadErrorKind::MemberTooLarge:
        return "Image too large";
    case LoadErrorKind::UnsupportedFormat:
        return "Invalid image format";
    case LoadErrorKind::DecompressionBomb:
        return "Decompression Bomb";
    case LoadErrorKind::OutOfMemory:
        return "Out of memory";
    case LoadErrorKind::InvalidCapacity:
        return "Cache capacity must be positive";
    case LoadErrorKind::Cancelled:
        return "Load cancelled";
    case LoadErrorKind::Internal:
        return "Load error";
    }
    return "Load error";
}

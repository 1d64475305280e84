#ifndef _LOAD_ERROR_HPP_
#define _LOAD_ERROR_HPP_

#include "PCH.h"

/**
 * @brief 加载链路上所有可能出现的错误类型
 * UI 只用它来生成提示文本，不据此改变控制流。
 */
enum class LoadErrorKind : std::uint8_t
{
    None,
    ArchiveNotFound,
    ArchiveCorrupt,
    ArchivePermissionDenied,
    MemberNotFound,
    MemberEmpty,
    MemberTooLarge,
    UnsupportedFormat,
    DecompressionBomb,
    OutOfMemory,
    InvalidCapacity,
    Cancelled,
    Internal
};

// 稳定的标识名，用于日志
const char *errorKindName(LoadErrorKind kind);

// 面向用户的描述文本
std::string describeError(LoadErrorKind kind);

inline bool isArchiveOpenError(LoadErrorKind kind)
{
    return kind == LoadErrorKind::ArchiveNotFound ||
           kind == LoadErrorKind::ArchiveCorrupt ||
           kind == LoadErrorKind::ArchivePermissionDenied;
}

/**
 * @class ArkviewError
 * @brief 引擎内部抛出的带类型异常
 *
 * 只在工作线程内部传播，LoadCoordinator 会把它转成 LoadResult，
 * 不会跨越异步边界。InvalidCapacity 例外：它是调用方的契约错误，直接抛给调用者。
 */
class ArkviewError : public std::runtime_error
{
public:
    ArkviewError(LoadErrorKind kind, const std::string &message) :
        std::runtime_error(message), m_kind(kind)
    {
    }

    LoadErrorKind kind() const
    {
        return m_kind;
    }

private:
    LoadErrorKind m_kind;
};

#endif

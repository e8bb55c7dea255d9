//! # Common Definitions
//!
//! Types and helpers shared by every semdiff component.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Source Locations**: positions and spans inside a source file
//! - **Result Type**: error handling without exceptions
//! - **Diff Errors**: the fatal error taxonomy of an analysis run
//! - **Smart Pointers**: aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership of AST nodes
//! - **Immutable Results**: snapshots and change lists are built once and only read afterwards

#ifndef SEMDIFF_COMMON_HPP
#define SEMDIFF_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace semdiff {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 3;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in a source file.
///
/// # Fields
///
/// - `file`: Path of the source file
/// - `line`: 1-based line number
/// - `column`: 1-based column number (bytes)
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A contiguous region of source code.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Returns a span from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = builder.build(revision, files);
/// if (is_err(result)) {
///     return unwrap_err(result);
/// }
/// const auto& snapshot = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Diff Errors
// ============================================================================

/// Category of a fatal analysis error.
enum class DiffErrorKind {
    SnapshotUnavailable,   ///< A tree state could not be obtained
    InternalInconsistency, ///< Extractor contract violated (duplicate key, bad request)
    Io,                    ///< Report output could not be written
    Usage,                 ///< Invalid command line or configuration
};

/// A fatal error that aborts the whole run before any report is produced.
struct DiffError {
    DiffErrorKind kind = DiffErrorKind::InternalInconsistency;
    std::string message;
};

/// Returns a stable lower-case name for an error kind.
[[nodiscard]] constexpr auto diff_error_kind_name(DiffErrorKind kind) -> const char* {
    switch (kind) {
    case DiffErrorKind::SnapshotUnavailable:
        return "snapshot unavailable";
    case DiffErrorKind::InternalInconsistency:
        return "internal inconsistency";
    case DiffErrorKind::Io:
        return "i/o error";
    case DiffErrorKind::Usage:
        return "usage error";
    }
    return "error";
}

/// Placeholder success type for operations that return nothing.
struct Unit {};

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace semdiff

#endif // SEMDIFF_COMMON_HPP

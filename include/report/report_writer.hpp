//! # Report Writer
//!
//! Renders the report views as JSON and writes the six report files.
//!
//! | File                              | View        |
//! |-----------------------------------|-------------|
//! | `all_code_changes.json`           | `all`       |
//! | `function_changes.json`           | `functions` |
//! | `type_changes.json`               | `types`     |
//! | `interface_changes.json`          | `traits`    |
//! | `method_changes.json`             | `methods`   |
//! | `function_changes_granular.json`  | `granular`  |
//!
//! All documents are rendered before the first file is opened, and each is
//! written to `<name>.tmp` first. The report files are only replaced once
//! every temporary file has been written. Existing reports are moved to
//! `<name>.bak` while the new set is installed; if any install step fails
//! they are moved back, so the directory holds either the old set or the
//! new one.

#ifndef SEMDIFF_REPORT_REPORT_WRITER_HPP
#define SEMDIFF_REPORT_REPORT_WRITER_HPP

#include "common.hpp"
#include "json/json_value.hpp"
#include "report/report.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace semdiff::report {

/// `all_code_changes.json`
[[nodiscard]] auto render_all(const Report& report) -> json::JsonValue;

/// `{added, modified, deleted}` document of one kind.
[[nodiscard]] auto render_kind(const KindView& view) -> json::JsonValue;

/// `function_changes_granular.json`: file, then function, then delta.
[[nodiscard]] auto render_granular(const Report& report) -> json::JsonValue;

/// File name and rendered document for all six report files.
[[nodiscard]] auto render_files(const Report& report)
    -> std::vector<std::pair<std::string, json::JsonValue>>;

class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

    /// Creates the output directory and writes every report file. Any
    /// failure is an `Io` error.
    [[nodiscard]] auto write(const Report& report) const -> Result<Unit, DiffError>;

    [[nodiscard]] auto output_dir() const -> const std::filesystem::path& {
        return output_dir_;
    }

private:
    std::filesystem::path output_dir_;
};

} // namespace semdiff::report

#endif // SEMDIFF_REPORT_REPORT_WRITER_HPP

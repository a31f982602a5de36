#include "decision_gate/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace decision_gate {

std::string format_validation_errors(const std::vector<ConfigValidationError>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty())
            joined += "; ";
        joined += error.field + ": " + error.message;
    }
    return joined;
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create directory " + path.parent_path().string() +
                                        ": " + ec.message(),
                                    "ConfigBase");
        }
    }

    std::ofstream out(path);
    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write " + filepath,
                                "ConfigBase");
    }

    try {
        out << std::setw(4) << to_json() << '\n';
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Cannot serialize configuration: ") + e.what(),
                                "ConfigBase");
    }

    if (!out) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write failed for " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot read " + filepath,
                                "ConfigBase");
    }

    try {
        from_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                filepath + " is not a valid configuration: " + e.what(),
                                "ConfigBase");
    }

    const auto errors = validate();
    if (!errors.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                filepath + ": " + format_validation_errors(errors), "ConfigBase");
    }
    return Result<void>();
}

}  // namespace decision_gate

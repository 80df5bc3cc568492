/**
 * @file Errors.hpp
 * @brief Exception types for permforge
 *
 * Error taxonomy:
 * - PermError: Base class
 * - SchemaError: Module document has the wrong shape
 * - CaseConflictError: Same group spelled with two different letter cases
 * - CyclicInheritanceError: Parent graph contains a cycle
 * - UnsupportedFeatureError: Backend profile cannot express an operation
 * - FileNotFoundError / ParseError / LoadError: Input could not be read
 * - MissingMandatoryConfig: Mandatory settings absent after merging
 */

#ifndef PERMFORGE_ERRORS_HPP
#define PERMFORGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>
#include <utility>

namespace permforge {

/**
 * @brief Base class for all permforge exceptions
 */
class PermError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A module document does not have the expected shape
 *
 * Raised for a non-mapping document root or section, a `groups` value that
 * is not a list, a `weights` value that is not an integer, or a
 * `permissions` value that is not a list of strings.
 */
class SchemaError : public PermError {
public:
    /**
     * @brief Construct with source, location and details
     * @param source Name of the document (usually its file path)
     * @param path Location inside the document (e.g., "weights.Admins")
     * @param details What was wrong with the value
     */
    SchemaError(std::string source, std::string path, std::string details)
        : PermError("Schema error in '" + source + "' at '" + path + "': " + details)
        , source_(std::move(source))
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string path_;
    std::string details_;
};

/**
 * @brief One group name appears with two different letter cases
 */
class CaseConflictError : public PermError {
public:
    /**
     * @brief Construct with both spellings
     * @param first Spelling seen first
     * @param second Conflicting spelling
     */
    CaseConflictError(std::string first, std::string second)
        : PermError("group '" + first + "' is also mentioned as '" + second +
                    "'; group names must use consistent letter case")
        , first_(std::move(first))
        , second_(std::move(second))
    {}

    const std::string& first() const noexcept {
        return first_;
    }

    const std::string& second() const noexcept {
        return second_;
    }

private:
    std::string first_;
    std::string second_;
};

/**
 * @brief The parent graph contains a cycle
 *
 * Contains the groups along the cycle, starting and ending with the same
 * group (e.g., A -> B -> A).
 */
class CyclicInheritanceError : public PermError {
public:
    explicit CyclicInheritanceError(std::vector<std::string> cycle)
        : PermError(format_message(cycle))
        , cycle_(std::move(cycle))
    {}

    const std::vector<std::string>& cycle() const noexcept {
        return cycle_;
    }

private:
    std::vector<std::string> cycle_;

    static std::string format_message(const std::vector<std::string>& cycle) {
        std::ostringstream oss;
        oss << "Cyclic group inheritance: ";
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) oss << " -> ";
            oss << cycle[i];
        }
        return oss.str();
    }
};

/**
 * @brief The chosen backend profile cannot represent an operation
 *
 * Carries the group (and node, where relevant) that triggered it.
 */
class UnsupportedFeatureError : public PermError {
public:
    /**
     * @param profile Backend profile name (e.g., "bPermissions")
     * @param feature What was requested (e.g., "negated permission")
     * @param group Group being translated
     * @param node Permission node, or empty if not node-specific
     */
    UnsupportedFeatureError(std::string profile, std::string feature,
                            std::string group, std::string node = "")
        : PermError(profile + " does not support " + feature + " (group '" + group + "'" +
                    (node.empty() ? std::string() : ", node '" + node + "'") + ")")
        , profile_(std::move(profile))
        , feature_(std::move(feature))
        , group_(std::move(group))
        , node_(std::move(node))
    {}

    const std::string& profile() const noexcept {
        return profile_;
    }

    const std::string& feature() const noexcept {
        return feature_;
    }

    const std::string& group() const noexcept {
        return group_;
    }

    const std::string& node() const noexcept {
        return node_;
    }

private:
    std::string profile_;
    std::string feature_;
    std::string group_;
    std::string node_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public PermError {
public:
    explicit FileNotFoundError(std::string path)
        : PermError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Syntax error in a YAML, TOML or JSON file
 */
class ParseError : public PermError {
public:
    /**
     * @param file Path to the file with the parse error
     * @param line 1-based line, or 0 if unknown
     * @param column 1-based column, or 0 if unknown
     * @param details Error message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : PermError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) oss << " at line " << line << ", column " << column;
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief A module directory or world could not be loaded
 */
class LoadError : public PermError {
public:
    using PermError::PermError;
};

/**
 * @brief Mandatory settings are missing after merge
 */
class MissingMandatoryConfig : public PermError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : PermError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace permforge

#endif // PERMFORGE_ERRORS_HPP

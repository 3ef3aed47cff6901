/* -- C++ -- */
/**
 *  @file  io/include/RenormErrors.hh
 *
 *  @brief Exception types raised while loading the renormalisation
 *         configuration and while scanning sample files.
 */

#ifndef FIDNORM_IO_RENORM_ERRORS_H
#define FIDNORM_IO_RENORM_ERRORS_H

#include <stdexcept>
#include <string>


/// Malformed or incomplete configuration; raised before any scan starts.
class ConfigError : public std::runtime_error
{
  public:
    explicit ConfigError(const std::string &what) : std::runtime_error("ConfigError: " + what) {}
};

/// A sample identifier could not be resolved, or a resolved file could not be opened or read.
class MissingFileError : public std::runtime_error
{
  public:
    explicit MissingFileError(const std::string &what) : std::runtime_error("MissingFileError: " + what) {}
};

class MissingTreeError : public std::runtime_error
{
  public:
    MissingTreeError(const std::string &path, const std::string &tree_name)
        : std::runtime_error("MissingTreeError: missing tree '" + tree_name + "' in " + path),
          m_path(path),
          m_tree_name(tree_name)
    {
    }

    const std::string &path() const noexcept { return m_path; }
    const std::string &tree_name() const noexcept { return m_tree_name; }

  private:
    std::string m_path;
    std::string m_tree_name;
};

/// A selection or weight expression failed to compile against the dataset columns.
class ExpressionError : public std::runtime_error
{
  public:
    explicit ExpressionError(const std::string &what) : std::runtime_error("ExpressionError: " + what) {}
};


#endif // FIDNORM_IO_RENORM_ERRORS_H

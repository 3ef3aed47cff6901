/* -- C++ -- */
/**
 *  @file  ana/include/YieldService.hh
 *
 *  @brief Weighted event yields over selected rows of sample datasets,
 *         evaluated with ROOT RDataFrame.
 */

#ifndef FIDNORM_ANA_YIELD_SERVICE_H
#define FIDNORM_ANA_YIELD_SERVICE_H

#include <string>
#include <vector>


enum class Direction
{
    kNominal,
    kUp,
    kDown
};

const char *direction_name(Direction direction) noexcept;

struct YieldSum
{
    double weighted_sum = 0.0;
    long long event_count = 0;

    YieldSum &operator+=(const YieldSum &other)
    {
        weighted_sum += other.weighted_sum;
        event_count += other.event_count;
        return *this;
    }
};

struct YieldResult
{
    std::string flavour;
    std::string systematic; ///< "nominal" for the nominal yield.
    Direction direction = Direction::kNominal;
    double weighted_sum = 0.0;
    long long event_count = 0;
};

/// One folder's share of a dataset union, filtered with that folder's selection.
struct DatasetSlice
{
    std::string folder;
    std::vector<std::string> files;
    std::string selection;
};

class YieldService
{
  public:
    explicit YieldService(std::string tree_name);

    const std::string &tree_name() const noexcept { return m_tree_name; }

    YieldSum compute_yield(const std::vector<std::string> &files,
                           const std::string &selection,
                           const std::string &weight_expr) const;

    YieldSum compute_yield(const std::vector<DatasetSlice> &slices,
                           const std::string &weight_expr) const;

  private:
    std::string m_tree_name;
};


#endif // FIDNORM_ANA_YIELD_SERVICE_H

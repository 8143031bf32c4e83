#pragma once

#include <algorithm>
#include <cassert>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @file grid2d.hpp
 * @brief Contiguous row-major 2D raster container.
 *
 * Holds elevation, slope, aspect, illumination and radiance bands.
 * Row 0 is the northern edge and column 0 the western edge of the scene.
 * Includes overflow-safe dimension math for allocations.
 */

namespace tpc
{

class Grid2D
{
public:
    /**
     * @brief Constructs an empty grid.
     */
    Grid2D() : rows_(0), cols_(0) {}

    /**
     * @brief Constructs a zero-initialized grid.
     * @param rows Number of rows (north-south).
     * @param cols Number of columns (west-east).
     */
    Grid2D(int rows, int cols) : rows_(rows), cols_(cols)
    {
        data_.resize(checked_size(rows, cols), 0.0);
    }

    /**
     * @brief Constructs a grid initialized with a constant value.
     * @param rows Number of rows.
     * @param cols Number of columns.
     * @param init_value Fill value.
     */
    Grid2D(int rows, int cols, double init_value) : rows_(rows), cols_(cols)
    {
        data_.resize(checked_size(rows, cols), init_value);
    }

    Grid2D(const Grid2D& other) = default;
    Grid2D& operator=(const Grid2D& other) = default;

    /**
     * @brief Move constructor.
     */
    Grid2D(Grid2D&& other) noexcept
        : rows_(other.rows_), cols_(other.cols_), data_(std::move(other.data_))
    {
        other.rows_ = other.cols_ = 0;
    }

    /**
     * @brief Move assignment.
     */
    Grid2D& operator=(Grid2D&& other) noexcept
    {
        if (this != &other)
        {
            rows_ = other.rows_;
            cols_ = other.cols_;
            data_ = std::move(other.data_);
            other.rows_ = other.cols_ = 0;
        }
        return *this;
    }

    /**
     * @brief Resizes and fills grid storage with a constant value.
     */
    void resize(int rows, int cols, double init_value = 0.0)
    {
        const size_t new_size = checked_size(rows, cols);
        rows_ = rows;
        cols_ = cols;
        data_.assign(new_size, init_value);
    }

    /**
     * @brief Assigns data from a nested row-major representation.
     * @param nested One inner vector per row, all of equal length.
     */
    void assign(const std::vector<std::vector<double>>& nested)
    {
        const int rows = static_cast<int>(nested.size());
        const int cols = rows > 0 ? static_cast<int>(nested[0].size()) : 0;
        for (const auto& row : nested)
        {
            if (static_cast<int>(row.size()) != cols)
            {
                throw std::invalid_argument("Grid2D::assign ragged nested rows");
            }
        }

        resize(rows, cols);
        if (cols == 0)
        {
            return;
        }
        for (int r = 0; r < rows; ++r)
        {
            std::copy(nested[r].begin(), nested[r].end(), data_.begin() + flatten_index(r, 0));
        }
    }

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    /**
     * @brief Returns total flattened element count.
     */
    size_t size() const { return data_.size(); }

    bool empty() const { return data_.empty(); }

    /**
     * @brief Reports whether another grid has identical dimensions.
     */
    bool same_shape(const Grid2D& other) const
    {
        return rows_ == other.rows_ && cols_ == other.cols_;
    }

    double* data() { return data_.data(); }
    const double* data() const { return data_.data(); }

    std::vector<double>::iterator begin() { return data_.begin(); }
    std::vector<double>::iterator end() { return data_.end(); }
    std::vector<double>::const_iterator begin() const { return data_.begin(); }
    std::vector<double>::const_iterator end() const { return data_.end(); }

    /**
     * @brief Mutable element access using `(row, col)` indexing.
     */
    double& operator()(int r, int c) { return data_[flatten_index(r, c)]; }

    /**
     * @brief Const element access using `(row, col)` indexing.
     */
    const double& operator()(int r, int c) const { return data_[flatten_index(r, c)]; }

    /**
     * @brief Element access with indices clamped into the grid.
     */
    double clamped(int r, int c) const
    {
        return data_[flatten_index(std::clamp(r, 0, rows_ - 1), std::clamp(c, 0, cols_ - 1))];
    }

private:
    size_t flatten_index(int r, int c) const
    {
        assert(r >= 0 && r < rows_ && c >= 0 && c < cols_);
        return static_cast<size_t>(r) * static_cast<size_t>(cols_) + static_cast<size_t>(c);
    }

    static size_t checked_size(int rows, int cols)
    {
        if (rows < 0 || cols < 0)
        {
            throw std::invalid_argument("Grid2D dimensions must be non-negative");
        }

        const size_t rows_sz = static_cast<size_t>(rows);
        const size_t cols_sz = static_cast<size_t>(cols);
        if (rows_sz != 0 && cols_sz > std::numeric_limits<size_t>::max() / rows_sz)
        {
            throw std::overflow_error("Grid2D size overflow on rows*cols");
        }
        return rows_sz * cols_sz;
    }

    int rows_;
    int cols_;
    std::vector<double> data_;
};

/**
 * @brief Ordered stack of co-registered spectral bands.
 */
using MultiBandImage = std::vector<Grid2D>;

} // namespace tpc

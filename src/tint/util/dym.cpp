#include "./dym.hpp"

#include <array>
#include <vector>

std::size_t tint::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    const auto n_rows    = b.size() + 1;
    const auto n_columns = a.size() + 1;

    const auto empty_row = std::vector<std::size_t>(n_columns, 0);

    std::vector<std::vector<std::size_t>> matrix(n_rows, empty_row);

    for (std::size_t n = 1; n < n_columns; ++n) {
        matrix[0][n] = n;
    }
    for (std::size_t n = 1; n < n_rows; ++n) {
        matrix[n][0] = n;
    }

    for (std::size_t row = 1; row < n_rows; ++row) {
        for (std::size_t col = 1; col < n_columns; ++col) {
            auto cost = a[col - 1] == b[row - 1] ? 0u : 1u;

            auto t1  = matrix[row - 1][col] + 1;
            auto t2  = matrix[row][col - 1] + 1;
            auto t3  = matrix[row - 1][col - 1] + cost;
            auto arr = std::array{t1, t2, t3};

            matrix[row][col] = *std::ranges::min_element(arr);
        }
    }

    return matrix.back().back();
}

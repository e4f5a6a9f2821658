#include <tpat/layout/GridResolver.hpp>

#include <numeric>
#include <string>
#include <variant>

namespace TP {
namespace {

auto field_of(std::string_view location, std::string_view key) -> std::string {
    std::string field{location};
    if (!field.empty()) {
        field.push_back('.');
    }
    field.append(key);
    return field;
}

auto is_delegated(AxisSpec const& spec) -> bool {
    return std::holds_alternative<ParentAxis>(spec);
}

auto sizes_of(AxisSpec const& spec, std::optional<ParentAxisContext> const& parent, std::string const& field)
    -> Expected<std::vector<std::uint32_t>> {
    if (auto const* sizes = std::get_if<std::vector<std::uint32_t>>(&spec)) {
        return *sizes;
    }
    if (!parent) {
        return std::unexpected(makeError(Error::Code::InvalidParentReference, field,
                                         "'parent' needs an enclosing patch with a resolved grid"));
    }
    return std::vector<std::uint32_t>(parent->sizes.begin(), parent->sizes.end());
}

} // namespace

auto AxisGrid::span_length(std::uint32_t first, std::uint32_t cells) const -> std::uint32_t {
    auto const last = first + cells - 1;
    return offsets.at(last) + sizes.at(last) - offsets.at(first);
}

auto axis_total(std::span<std::uint32_t const> sizes, std::uint32_t border, std::uint32_t spacing) -> std::uint64_t {
    auto const sum = std::accumulate(sizes.begin(), sizes.end(), std::uint64_t{0});
    auto const gaps = sizes.empty() ? std::uint64_t{0} : static_cast<std::uint64_t>(sizes.size() - 1);
    return 2 * static_cast<std::uint64_t>(border) + sum + gaps * spacing;
}

auto resolve_axis(AxisRequest const& request,
                  std::uint32_t origin,
                  std::optional<std::uint32_t> extent,
                  std::optional<ParentAxisContext> const& parent,
                  std::string_view location) -> Expected<AxisGrid> {
    AxisGrid grid;
    grid.origin = origin;
    grid.border = request.border;

    // columns/rows take precedence over width/height as the breakdown of the axis.
    auto const& primary = request.breakdown ? request.breakdown : request.total;
    auto const primary_key = request.breakdown ? request.breakdown_key : request.total_key;
    bool delegated = false;
    if (primary) {
        auto sizes = sizes_of(*primary, parent, field_of(location, primary_key));
        if (!sizes) {
            return std::unexpected(sizes.error());
        }
        grid.sizes = std::move(*sizes);
        delegated = is_delegated(*primary);
    } else {
        if (!extent) {
            return std::unexpected(makeError(Error::Code::MissingField, field_of(location, request.total_key),
                                             "the axis has no size"));
        }
        if (2 * static_cast<std::uint64_t>(request.border) > *extent) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(location, "border"),
                                             "the border is wider than the patch"));
        }
        grid.sizes.push_back(*extent - 2 * request.border);
    }
    grid.spacing = request.spacing.value_or(delegated && parent ? parent->spacing : 0);

    auto const total = axis_total(grid.sizes, grid.border, grid.spacing);
    if (total > kMaxAxisLength) {
        return std::unexpected(makeError(Error::Code::InvalidValue, field_of(location, primary_key),
                                         "the axis spans " + std::to_string(total) + " pixels, more than the maximum of "
                                             + std::to_string(kMaxAxisLength)));
    }
    grid.total = static_cast<std::uint32_t>(total);

    if (request.breakdown && request.total) {
        std::uint64_t declared = 0;
        auto const total_field = field_of(location, request.total_key);
        auto const* scalar = std::get_if<std::vector<std::uint32_t>>(&*request.total);
        if (scalar && scalar->size() == 1) {
            declared = scalar->front();
        } else {
            auto sizes = sizes_of(*request.total, parent, total_field);
            if (!sizes) {
                return std::unexpected(sizes.error());
            }
            declared = axis_total(*sizes, grid.border, grid.spacing);
        }
        if (declared != total) {
            return std::unexpected(makeError(Error::Code::SizeMismatch, total_field,
                                             std::to_string(declared) + " does not match the " + std::string{request.breakdown_key}
                                                 + " total of " + std::to_string(total)));
        }
    }

    grid.offsets.reserve(grid.sizes.size());
    std::uint32_t cursor = origin + grid.border;
    for (auto size : grid.sizes) {
        grid.offsets.push_back(cursor);
        cursor += size + grid.spacing;
    }
    return grid;
}

} // namespace TP

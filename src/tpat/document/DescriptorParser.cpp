#include <tpat/document/DescriptorParser.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace TP {
namespace {

using Json = nlohmann::json;

struct KeyInfo {
    std::string_view name;
    int              since_version = 1;
    bool             root_only = false;
};

constexpr auto kKeys = std::to_array<KeyInfo>({
    {"version", 1, true},
    {"depth", 1, true},
    {"name", 1, true},
    {"width", 1, false},
    {"height", 1, false},
    {"columns", 1, false},
    {"rows", 1, false},
    {"color", 1, false},
    {"hramp", 1, false},
    {"vramp", 1, false},
    {"subpatches", 1, false},
    {"left", 1, false},
    {"top", 1, false},
    {"right", 1, false},
    {"bottom", 1, false},
    {"border", 2, false},
    {"spacing", 2, false},
    {"bordercolor", 2, false},
    {"cell", 2, false},
    {"hsquare", 2, false},
    {"vsquare", 2, false},
    {"hsine", 2, false},
    {"hcosine", 2, false},
    {"vsine", 2, false},
    {"vcosine", 2, false},
    {"image", 2, false},
    {"premul", 2, false},
    {"description", 2, false},
    {"descriptions", 2, false},
    {"patches", 2, false},
});

constexpr auto kBackgroundKeys = std::to_array<std::string_view>(
    {"color", "hramp", "vramp", "hsquare", "vsquare", "hsine", "hcosine", "vsine", "vcosine"});

[[nodiscard]] auto find_key(std::string_view name) -> KeyInfo const* {
    for (auto const& key : kKeys) {
        if (key.name == name) {
            return &key;
        }
    }
    return nullptr;
}

[[nodiscard]] auto join_field(std::string_view location, std::string_view key) -> std::string {
    std::string field{location};
    if (!field.empty()) {
        field.push_back('.');
    }
    field.append(key);
    return field;
}

[[nodiscard]] auto index_field(std::string_view field, std::size_t index) -> std::string {
    std::string result{field};
    result.push_back('[');
    result.append(std::to_string(index));
    result.push_back(']');
    return result;
}

[[nodiscard]] auto fail(Error::Code code, std::string_view field, std::string_view detail) -> std::unexpected<Error> {
    return std::unexpected(makeError(code, field, detail));
}

[[nodiscard]] auto read_uint(Json const& value, std::string_view field, std::uint32_t minimum)
    -> Expected<std::uint32_t> {
    if (!value.is_number_integer()) {
        return fail(Error::Code::InvalidType, field, "must be an integer");
    }
    std::uint64_t magnitude = 0;
    if (value.is_number_unsigned()) {
        magnitude = value.get<std::uint64_t>();
    } else {
        auto signed_value = value.get<std::int64_t>();
        if (signed_value < 0) {
            return fail(Error::Code::InvalidValue, field, "must not be negative");
        }
        magnitude = static_cast<std::uint64_t>(signed_value);
    }
    if (magnitude < minimum) {
        return fail(Error::Code::InvalidValue, field, "must be at least " + std::to_string(minimum));
    }
    if (magnitude > std::numeric_limits<std::uint32_t>::max()) {
        return fail(Error::Code::InvalidValue, field, "is too large");
    }
    return static_cast<std::uint32_t>(magnitude);
}

[[nodiscard]] auto read_number(Json const& value, std::string_view field) -> Expected<double> {
    if (!value.is_number()) {
        return fail(Error::Code::InvalidType, field, "must be a number");
    }
    return value.get<double>();
}

[[nodiscard]] auto read_color(Json const& value, std::string_view field) -> Expected<Color> {
    if (value.is_number()) {
        return Color::Grey(value.get<double>());
    }
    if (value.is_array()) {
        if (value.size() != 3) {
            return fail(Error::Code::InvalidValue, field, "an RGB color needs exactly 3 components");
        }
        std::array<double, 3> channels{};
        for (std::size_t i = 0; i < 3; ++i) {
            auto component = read_number(value[i], index_field(field, i));
            if (!component) {
                return std::unexpected(component.error());
            }
            channels[i] = *component;
        }
        return Color::Rgb(channels[0], channels[1], channels[2]);
    }
    return fail(Error::Code::InvalidType, field, "must be a number or an array of 3 numbers");
}

[[nodiscard]] auto read_axis(Json const& value, std::string_view field) -> Expected<AxisSpec> {
    if (value.is_string()) {
        if (value.get<std::string>() == "parent") {
            return AxisSpec{ParentAxis{}};
        }
        return fail(Error::Code::InvalidValue, field, "the only string value allowed is \"parent\"");
    }
    if (value.is_array()) {
        if (value.empty()) {
            return fail(Error::Code::InvalidValue, field, "must list at least one size");
        }
        std::vector<std::uint32_t> sizes;
        sizes.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto size = read_uint(value[i], index_field(field, i), 1);
            if (!size) {
                return std::unexpected(size.error());
            }
            sizes.push_back(*size);
        }
        return AxisSpec{std::move(sizes)};
    }
    auto size = read_uint(value, field, 1);
    if (!size) {
        return std::unexpected(size.error());
    }
    return AxisSpec{std::vector<std::uint32_t>{*size}};
}

// A scalar applies to both axes; a pair is [vertical, horizontal].
[[nodiscard]] auto read_pair(Json const& value, std::string_view field) -> Expected<AxisPair> {
    if (value.is_array()) {
        if (value.size() != 2) {
            return fail(Error::Code::InvalidValue, field, "must be a number or a [vertical, horizontal] pair");
        }
        auto vertical = read_uint(value[0], index_field(field, 0), 0);
        if (!vertical) {
            return std::unexpected(vertical.error());
        }
        auto horizontal = read_uint(value[1], index_field(field, 1), 0);
        if (!horizontal) {
            return std::unexpected(horizontal.error());
        }
        return AxisPair{.vertical = *vertical, .horizontal = *horizontal};
    }
    auto both = read_uint(value, field, 0);
    if (!both) {
        return std::unexpected(both.error());
    }
    return AxisPair{.vertical = *both, .horizontal = *both};
}

[[nodiscard]] auto read_ramp(Json const& value, std::string_view field, Axis axis) -> Expected<Background> {
    if (!value.is_array() || value.size() != 2) {
        return fail(Error::Code::InvalidType, field, "must be a [from, to] pair of colors");
    }
    auto from = read_color(value[0], index_field(field, 0));
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = read_color(value[1], index_field(field, 1));
    if (!to) {
        return std::unexpected(to.error());
    }
    return Background{GradientFill{.axis = axis, .from = *from, .to = *to}};
}

[[nodiscard]] auto read_grating(Json const& value, std::string_view field, Axis axis, Waveform waveform)
    -> Expected<Background> {
    if (!value.is_array() || (value.size() != 3 && value.size() != 4)) {
        return fail(Error::Code::InvalidType, field,
                    "must be [halfPeriod, colorA, colorB] or [startHalfPeriod, endHalfPeriod, colorA, colorB]");
    }
    GratingFill fill{.axis = axis, .waveform = waveform};
    auto start = read_number(value[0], index_field(field, 0));
    if (!start) {
        return std::unexpected(start.error());
    }
    fill.start_half_period = *start;
    fill.end_half_period = *start;
    std::size_t color_index = 1;
    if (value.size() == 4) {
        auto end = read_number(value[1], index_field(field, 1));
        if (!end) {
            return std::unexpected(end.error());
        }
        fill.end_half_period = *end;
        color_index = 2;
    }
    if (!(fill.start_half_period > 0.0) || !(fill.end_half_period > 0.0)) {
        return fail(Error::Code::InvalidValue, field, "half-periods must be positive");
    }
    auto first = read_color(value[color_index], index_field(field, color_index));
    if (!first) {
        return std::unexpected(first.error());
    }
    auto second = read_color(value[color_index + 1], index_field(field, color_index + 1));
    if (!second) {
        return std::unexpected(second.error());
    }
    fill.first = *first;
    fill.second = *second;
    return Background{fill};
}

[[nodiscard]] auto read_background(Json const& value, std::string_view key, std::string_view field)
    -> Expected<Background> {
    if (key == "color") {
        auto color = read_color(value, field);
        if (!color) {
            return std::unexpected(color.error());
        }
        return Background{SolidFill{*color}};
    }
    if (key == "hramp") {
        return read_ramp(value, field, Axis::Horizontal);
    }
    if (key == "vramp") {
        return read_ramp(value, field, Axis::Vertical);
    }
    auto const axis = key.front() == 'h' ? Axis::Horizontal : Axis::Vertical;
    auto const kind = key.substr(1);
    if (kind == "square") {
        return read_grating(value, field, axis, Waveform::Square);
    }
    if (kind == "sine") {
        return read_grating(value, field, axis, Waveform::Sine);
    }
    return read_grating(value, field, axis, Waveform::Cosine);
}

[[nodiscard]] auto read_cell(Json const& value, std::string_view field) -> Expected<CellRef> {
    if (!value.is_array() || (value.size() != 2 && value.size() != 4)) {
        return fail(Error::Code::InvalidType, field, "must be [row, column] or [row, column, lastRow, lastColumn]");
    }
    std::array<std::uint32_t, 4> indices{};
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto index = read_uint(value[i], index_field(field, i), 0);
        if (!index) {
            return std::unexpected(index.error());
        }
        indices[i] = *index;
    }
    CellRef cell{.row = indices[0], .column = indices[1]};
    if (value.size() == 4) {
        cell.last_row = indices[2];
        cell.last_column = indices[3];
    }
    return cell;
}

[[nodiscard]] auto read_descriptions(Json const& value, std::string_view field) -> Expected<std::vector<std::string>> {
    std::vector<std::string> descriptions;
    if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (!value[i].is_string()) {
                return fail(Error::Code::InvalidType, index_field(field, i), "must be a string");
            }
            descriptions.push_back(value[i].get<std::string>());
        }
        return descriptions;
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it->is_string()) {
                return fail(Error::Code::InvalidType, join_field(field, it.key()), "must be a string");
            }
            descriptions.push_back(it->get<std::string>());
        }
        return descriptions;
    }
    return fail(Error::Code::InvalidType, field, "must be an array or an object of strings");
}

class DescriptorReader {
public:
    explicit DescriptorReader(Document& document)
        : document_(document) {}

    auto read_root(Json const& json) -> Expected<void> {
        if (!json.is_object()) {
            return fail(Error::Code::MalformedInput, "", "the descriptor must be a JSON object");
        }
        if (auto it = json.find("version"); it != json.end()) {
            auto version = read_uint(*it, "version", 1);
            if (!version) {
                return std::unexpected(version.error());
            }
            if (*version > static_cast<std::uint32_t>(kLatestVersion)) {
                return fail(Error::Code::UnsupportedVersion, "version",
                            "supported versions are 1 and 2, got " + std::to_string(*version));
            }
            document_.version = static_cast<int>(*version);
        }

        auto depth_it = json.find("depth");
        if (depth_it == json.end()) {
            return fail(Error::Code::MissingField, "depth", "is required");
        }
        if (!depth_it->is_number_integer()) {
            return fail(Error::Code::InvalidType, "depth", "must be an integer");
        }
        auto depth = depth_from_bits(depth_it->get<long long>());
        if (!depth) {
            return fail(Error::Code::InvalidValue, "depth", "must be one of 8, 10, 12, 16 or 32");
        }
        document_.depth = *depth;

        if (auto it = json.find("name"); it != json.end()) {
            if (!it->is_string()) {
                return fail(Error::Code::InvalidType, "name", "must be a string");
            }
            document_.name = it->get<std::string>();
        }

        bool const has_width = json.contains("width") || json.contains("columns");
        bool const has_height = json.contains("height") || json.contains("rows");
        if (!has_width || !has_height) {
            return fail(Error::Code::MissingField, has_width ? "height" : "width",
                        "the descriptor needs width and height, or columns and rows");
        }

        auto root = read_patch(json, "", true);
        if (!root) {
            return std::unexpected(root.error());
        }
        return {};
    }

private:
    auto check_keys(Json const& json, std::string const& location, bool is_root) -> Expected<void> {
        for (auto it = json.begin(); it != json.end(); ++it) {
            auto const field = join_field(location, it.key());
            auto const* info = find_key(it.key());
            if (info == nullptr || (info->root_only && !is_root)) {
                return fail(Error::Code::UnknownKey, field, "is not a recognized key");
            }
            if (info->since_version > document_.version) {
                return fail(Error::Code::VersionTooLow, field,
                            "requires version " + std::to_string(info->since_version) + " but the descriptor declares version "
                                + std::to_string(document_.version));
            }
        }
        return {};
    }

    auto read_grid(Json const& json, std::string const& location, GridSpec& grid) -> Expected<void> {
        auto read = [&](char const* key, std::optional<AxisSpec>& target) -> Expected<void> {
            if (auto it = json.find(key); it != json.end()) {
                auto axis = read_axis(*it, join_field(location, key));
                if (!axis) {
                    return std::unexpected(axis.error());
                }
                target = std::move(*axis);
            }
            return {};
        };
        if (auto ok = read("width", grid.width); !ok) {
            return ok;
        }
        if (auto ok = read("columns", grid.columns); !ok) {
            return ok;
        }
        if (auto ok = read("height", grid.height); !ok) {
            return ok;
        }
        return read("rows", grid.rows);
    }

    auto read_placement(Json const& json, std::string const& location, PlacementSpec& placement) -> Expected<void> {
        if (auto it = json.find("cell"); it != json.end()) {
            auto cell = read_cell(*it, join_field(location, "cell"));
            if (!cell) {
                return std::unexpected(cell.error());
            }
            placement.cell = *cell;
        }
        auto read = [&](char const* key, std::optional<std::uint32_t>& target) -> Expected<void> {
            if (auto it = json.find(key); it != json.end()) {
                auto value = read_uint(*it, join_field(location, key), 0);
                if (!value) {
                    return std::unexpected(value.error());
                }
                target = *value;
            }
            return {};
        };
        if (auto ok = read("left", placement.legacy.left); !ok) {
            return ok;
        }
        if (auto ok = read("top", placement.legacy.top); !ok) {
            return ok;
        }
        if (auto ok = read("right", placement.legacy.right); !ok) {
            return ok;
        }
        return read("bottom", placement.legacy.bottom);
    }

    auto read_appearance(Json const& json, std::string const& location, Patch& patch) -> Expected<void> {
        if (auto it = json.find("border"); it != json.end()) {
            auto border = read_pair(*it, join_field(location, "border"));
            if (!border) {
                return std::unexpected(border.error());
            }
            patch.border = *border;
        }
        if (auto it = json.find("spacing"); it != json.end()) {
            auto spacing = read_pair(*it, join_field(location, "spacing"));
            if (!spacing) {
                return std::unexpected(spacing.error());
            }
            patch.spacing = *spacing;
        }
        if (auto it = json.find("bordercolor"); it != json.end()) {
            auto color = read_color(*it, join_field(location, "bordercolor"));
            if (!color) {
                return std::unexpected(color.error());
            }
            patch.border_color = *color;
        }

        std::string_view background_key;
        for (auto key : kBackgroundKeys) {
            auto it = json.find(key);
            if (it == json.end()) {
                continue;
            }
            if (!background_key.empty()) {
                return fail(Error::Code::ConflictingFields, location.empty() ? "root" : location,
                            "'" + std::string{background_key} + "' and '" + std::string{key}
                                + "' both define the background");
            }
            background_key = key;
            auto background = read_background(*it, key, join_field(location, key));
            if (!background) {
                return std::unexpected(background.error());
            }
            patch.background = std::move(*background);
        }

        if (auto it = json.find("image"); it != json.end()) {
            if (!it->is_string() || it->get<std::string>().empty()) {
                return fail(Error::Code::InvalidType, join_field(location, "image"), "must be a non-empty path");
            }
            patch.image = OverlaySpec{.path = it->get<std::string>()};
        }
        if (auto it = json.find("premul"); it != json.end()) {
            if (!it->is_boolean()) {
                return fail(Error::Code::InvalidType, join_field(location, "premul"), "must be a bool");
            }
            if (!patch.image) {
                return fail(Error::Code::ConflictingFields, join_field(location, "premul"), "has no image to apply to");
            }
            patch.image->premultiplied = it->get<bool>();
        }

        if (auto it = json.find("description"); it != json.end()) {
            if (!it->is_string()) {
                return fail(Error::Code::InvalidType, join_field(location, "description"), "must be a string");
            }
            patch.description = it->get<std::string>();
        }
        if (auto it = json.find("descriptions"); it != json.end()) {
            auto descriptions = read_descriptions(*it, join_field(location, "descriptions"));
            if (!descriptions) {
                return std::unexpected(descriptions.error());
            }
            patch.descriptions = std::move(*descriptions);
        }
        return {};
    }

    auto read_patch(Json const& json, std::string const& location, bool is_root) -> Expected<PatchIndex> {
        if (!json.is_object()) {
            return fail(Error::Code::InvalidType, location, "a patch must be an object or a color");
        }
        if (auto keys = check_keys(json, location, is_root); !keys) {
            return std::unexpected(keys.error());
        }

        Patch patch;
        patch.location = location;
        if (auto ok = read_grid(json, location, patch.grid); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = read_appearance(json, location, patch); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = read_placement(json, location, patch.placement); !ok) {
            return std::unexpected(ok.error());
        }

        auto const index = document_.add_patch(std::move(patch));

        auto patches_it = json.find("patches");
        auto subpatches_it = json.find("subpatches");
        if (patches_it != json.end() && subpatches_it != json.end()) {
            return fail(Error::Code::ConflictingFields, join_field(location, "patches"),
                        "'patches' and its deprecated alias 'subpatches' are both present");
        }
        auto children_it = patches_it != json.end() ? patches_it : subpatches_it;
        if (children_it == json.end()) {
            return index;
        }
        auto const children_field = join_field(location, patches_it != json.end() ? "patches" : "subpatches");
        if (!children_it->is_array()) {
            return fail(Error::Code::InvalidType, children_field, "must be an array");
        }

        for (std::size_t i = 0; i < children_it->size(); ++i) {
            auto const& entry = (*children_it)[i];
            auto const child_location = index_field(children_field, i);
            Expected<PatchIndex> child = std::unexpected(Error{Error::Code::UnknownError, {}});
            if (entry.is_object()) {
                child = read_patch(entry, child_location, false);
            } else {
                // A bare color is shorthand for a solid patch at the next default cell.
                auto color = read_color(entry, child_location);
                if (!color) {
                    return std::unexpected(color.error());
                }
                Patch solid;
                solid.location = child_location;
                solid.background = SolidFill{*color};
                child = document_.add_patch(std::move(solid));
            }
            if (!child) {
                return std::unexpected(child.error());
            }
            document_.patches[index].children.push_back(*child);
        }
        return index;
    }

    Document& document_;
};

} // namespace

auto ParseDescriptor(std::string_view text, std::filesystem::path base_directory) -> Expected<Document> {
    auto json = Json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded()) {
        return fail(Error::Code::MalformedInput, "", "the descriptor is not valid JSON");
    }

    Document document;
    document.base_directory = std::move(base_directory);
    DescriptorReader reader{document};
    if (auto read = reader.read_root(json); !read) {
        tp_log("Descriptor rejected: " + describeError(read.error()), "Descriptor", "Error");
        return std::unexpected(read.error());
    }
    if (auto valid = ValidateDocument(document); !valid) {
        tp_log("Descriptor rejected: " + describeError(valid.error()), "Descriptor", "Error");
        return std::unexpected(valid.error());
    }
    tp_log("Parsed descriptor with " + std::to_string(document.size()) + " patches at depth "
               + std::to_string(bit_count(document.depth)),
           "Descriptor");
    return document;
}

auto LoadDescriptor(std::filesystem::path const& path) -> Expected<Document> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return fail(Error::Code::ResourceNotFound, path.string(), "descriptor file does not exist");
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return fail(Error::Code::ResourceUnreadable, path.string(), "descriptor file cannot be opened");
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    if (stream.bad()) {
        return fail(Error::Code::ResourceUnreadable, path.string(), "failed while reading the descriptor");
    }

    auto absolute = std::filesystem::absolute(path, ec);
    auto base_directory = ec ? path.parent_path() : absolute.parent_path();
    return ParseDescriptor(contents.str(), base_directory);
}

} // namespace TP

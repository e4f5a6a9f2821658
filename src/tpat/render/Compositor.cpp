#include <tpat/render/Compositor.hpp>

#include <tpat/render/OverlayPrefetch.hpp>
#include <tpat/render/Waveform.hpp>

#include "log/TaggedLogger.hpp"
#include "taskpool/TaskGroup.hpp"
#include "taskpool/TaskPool.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace TP {
namespace {

// Samples a fill along one axis; the other axis repeats the same line.
template <typename Sampler>
auto fill_along(RasterImage& image, Rect const& rect, Axis axis, Depth depth, Sampler sample) -> void {
    if (axis == Axis::Horizontal) {
        std::vector<Pixel> line(rect.width);
        for (std::uint32_t x = 0; x < rect.width; ++x) {
            line[x] = quantize_unchecked(sample(x, rect.width), depth);
        }
        for (auto y = rect.y; y < rect.bottom(); ++y) {
            auto row = image.row(y);
            for (std::uint32_t x = 0; x < rect.width; ++x) {
                std::copy(line[x].begin(), line[x].end(), row.begin() + static_cast<std::ptrdiff_t>(rect.x + x) * 3);
            }
        }
        return;
    }
    for (std::uint32_t y = 0; y < rect.height; ++y) {
        auto pixel = quantize_unchecked(sample(y, rect.height), depth);
        image.fill(Rect{.x = rect.x, .y = rect.y + y, .width = rect.width, .height = 1}, pixel);
    }
}

class RenderPass {
public:
    RenderPass(Document const& document, Layout const& layout, RasterImage& image, TaskPool& pool, OverlayPrefetch& overlays)
        : document_(document), layout_(layout), image_(image), pool_(pool), overlays_(overlays) {}

    auto render_patch(PatchIndex index) -> Expected<void> {
        auto const& patch = document_.patch(index);
        auto const& geometry = layout_.geometry(index);
        if (geometry.rect.empty()) {
            return {};
        }

        draw_background(patch, geometry.rect);
        if (patch.border_color) {
            auto const pixel = quantize_unchecked(*patch.border_color, document_.depth);
            draw_border(patch, geometry.rect, pixel);
            draw_spacing(geometry, pixel);
        }

        if (geometry.overlapping_children) {
            for (auto child : patch.children) {
                if (auto drawn = render_patch(child); !drawn) {
                    return drawn;
                }
            }
        } else if (!patch.children.empty()) {
            // Children own disjoint rectangles, so they draw without locking.
            TaskGroup group{pool_};
            for (auto child : patch.children) {
                group.run([this, child]() { return render_patch(child); });
            }
            if (auto joined = group.wait(); !joined) {
                return joined;
            }
        }

        if (patch.image) {
            auto overlay = overlays_.await(index);
            if (!overlay) {
                return std::unexpected(overlay.error());
            }
            auto composited = CompositeOverlay(image_, geometry.rect, **overlay, patch.image->premultiplied.value_or(true));
            if (!composited) {
                auto field = patch.location.empty() ? std::string{"image"} : patch.location + ".image";
                return std::unexpected(makeError(composited.error().code, field, composited.error().message.value_or("")));
            }
        }
        return {};
    }

private:
    auto draw_background(Patch const& patch, Rect const& rect) -> void {
        auto const depth = document_.depth;
        if (auto const* solid = std::get_if<SolidFill>(&patch.background)) {
            image_.fill(rect, quantize_unchecked(solid->color, depth));
        } else if (auto const* gradient = std::get_if<GradientFill>(&patch.background)) {
            fill_along(image_, rect, gradient->axis, depth, [gradient](std::uint32_t offset, std::uint32_t length) {
                return gradient_color(*gradient, offset, length);
            });
        } else if (auto const* grating = std::get_if<GratingFill>(&patch.background)) {
            fill_along(image_, rect, grating->axis, depth, [grating](std::uint32_t offset, std::uint32_t length) {
                return grating_color(*grating, offset, length);
            });
        }
    }

    auto draw_border(Patch const& patch, Rect const& rect, Pixel const& pixel) -> void {
        if (!patch.border) {
            return;
        }
        auto const horizontal = std::min(patch.border->horizontal, rect.width);
        auto const vertical = std::min(patch.border->vertical, rect.height);
        image_.fill(Rect{.x = rect.x, .y = rect.y, .width = rect.width, .height = vertical}, pixel);
        image_.fill(Rect{.x = rect.x, .y = rect.bottom() - vertical, .width = rect.width, .height = vertical}, pixel);
        image_.fill(Rect{.x = rect.x, .y = rect.y, .width = horizontal, .height = rect.height}, pixel);
        image_.fill(Rect{.x = rect.right() - horizontal, .y = rect.y, .width = horizontal, .height = rect.height}, pixel);
    }

    // Gaps run across the whole area inside the border.
    auto draw_spacing(ResolvedGeometry const& geometry, Pixel const& pixel) -> void {
        auto const& rect = geometry.rect;
        auto const& columns = geometry.columns;
        auto const& rows = geometry.rows;
        auto const inner_top = rect.y + rows.border;
        auto const inner_height = rect.height - 2 * rows.border;
        auto const inner_left = rect.x + columns.border;
        auto const inner_width = rect.width - 2 * columns.border;
        if (columns.spacing > 0) {
            for (std::uint32_t i = 0; i + 1 < columns.count(); ++i) {
                auto const gap = columns.offsets[i] + columns.sizes[i];
                image_.fill(Rect{.x = gap, .y = inner_top, .width = columns.spacing, .height = inner_height}, pixel);
            }
        }
        if (rows.spacing > 0) {
            for (std::uint32_t i = 0; i + 1 < rows.count(); ++i) {
                auto const gap = rows.offsets[i] + rows.sizes[i];
                image_.fill(Rect{.x = inner_left, .y = gap, .width = inner_width, .height = rows.spacing}, pixel);
            }
        }
    }

    Document const&  document_;
    Layout const&    layout_;
    RasterImage&     image_;
    TaskPool&        pool_;
    OverlayPrefetch& overlays_;
};

} // namespace

Compositor::Compositor(TaskPool& pool, OverlaySource& overlays)
    : pool_(pool), overlays_(overlays) {}

auto Compositor::render(Document const& document, Layout const& layout) -> Expected<RasterImage> {
    if (layout.patches.size() != document.size()) {
        return std::unexpected(makeError(Error::Code::InvalidValue, "layout", "does not belong to this document"));
    }
    RasterImage image{layout.width, layout.height, document.depth};

    OverlayPrefetch prefetch{pool_, overlays_};
    prefetch.request_all(document);

    RenderPass pass{document, layout, image, pool_, prefetch};
    if (auto rendered = pass.render_patch(kRootPatch); !rendered) {
        tp_log("Render failed: " + describeError(rendered.error()), "Render", "Error");
        return std::unexpected(rendered.error());
    }
    tp_log("Rendered " + std::to_string(image.width()) + "x" + std::to_string(image.height()) + " at "
               + std::to_string(bit_count(document.depth)) + " bits",
           "Render");
    return image;
}

auto CompositeOverlay(RasterImage& image, Rect const& rect, OverlayImage const& overlay, bool premultiplied)
    -> Expected<void> {
    if (overlay.width > rect.width || overlay.height > rect.height) {
        return std::unexpected(makeError(Error::Code::OutOfBounds, "",
                                         "the " + std::to_string(overlay.width) + "x" + std::to_string(overlay.height)
                                             + " image is larger than the " + std::to_string(rect.width) + "x"
                                             + std::to_string(rect.height) + " patch"));
    }
    auto const depth = image.depth();
    auto const left = rect.x + (rect.width - overlay.width) / 2;
    auto const top = rect.y + (rect.height - overlay.height) / 2;
    auto const channels = static_cast<std::size_t>(overlay.channels);

    for (std::uint32_t y = 0; y < overlay.height; ++y) {
        auto row = image.row(top + y);
        for (std::uint32_t x = 0; x < overlay.width; ++x) {
            auto const* source = overlay.samples.data() + (static_cast<std::size_t>(y) * overlay.width + x) * channels;
            auto* dest = row.data() + static_cast<std::size_t>(left + x) * 3;
            if (!overlay.has_alpha()) {
                for (std::size_t c = 0; c < 3; ++c) {
                    dest[c] = denormalize_sample(source[c], depth);
                }
                continue;
            }
            auto const alpha = source[3];
            for (std::size_t c = 0; c < 3; ++c) {
                auto const below = normalize_sample(dest[c], depth);
                auto const above = premultiplied ? source[c] : alpha * source[c];
                dest[c] = denormalize_sample(below * (1.0f - alpha) + above, depth);
            }
        }
    }
    return {};
}

} // namespace TP

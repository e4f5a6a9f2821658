#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>
#include <tpat/layout/Layout.hpp>
#include <tpat/render/OverlaySource.hpp>
#include <tpat/render/RasterImage.hpp>

namespace TP {

class TaskPool;

// Draws a resolved document. For each patch, in order: background over the
// whole rectangle, border band and spacing gaps in `bordercolor`, children
// (in parallel on the pool), then the overlay image on top.
class Compositor {
public:
    Compositor(TaskPool& pool, OverlaySource& overlays);

    [[nodiscard]] auto render(Document const& document, Layout const& layout) -> Expected<RasterImage>;

private:
    TaskPool&      pool_;
    OverlaySource& overlays_;
};

// Blends `overlay` centered on `rect`. RGB overlays replace the covered pixels;
// RGBA overlays are blended as premultiplied, or with straight alpha when
// `premultiplied` is false.
[[nodiscard]] auto CompositeOverlay(RasterImage& image, Rect const& rect, OverlayImage const& overlay, bool premultiplied)
    -> Expected<void>;

} // namespace TP

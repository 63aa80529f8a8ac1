#include "wallpanel/layout_stats.hpp"

namespace wallpanel {

LayoutStats layout_stats(const WallLayout& layout) {
    LayoutStats st;
    st.wall_area = (layout.width > 0.0 && layout.height > 0.0) ? layout.width * layout.height : 0.0;
    for (const auto& p : layout.panels) {
        ++st.panel_count;
        st.cutout_count += static_cast<int>(p.cutouts.size());
        st.panel_area += p.w * p.h;
    }
    return st;
}

LayoutStats total_stats(const std::vector<WallLayout>& layouts) {
    LayoutStats total;
    for (const auto& l : layouts) {
        const LayoutStats st = layout_stats(l);
        total.panel_count += st.panel_count;
        total.cutout_count += st.cutout_count;
        total.panel_area += st.panel_area;
        total.wall_area += st.wall_area;
    }
    return total;
}

}  // namespace wallpanel

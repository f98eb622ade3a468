#include <service_render/style.hpp>
#include <unordered_map>

namespace service_render {

GradientColors category_colors(const std::string& category) {
    static const std::unordered_map<std::string, GradientColors> colors = {
        { "compute", { from_rgb_hex(0xFF9900), from_rgb_hex(0xFF6600) } },
        { "storage", { from_rgb_hex(0x569A31), from_rgb_hex(0x3E7B1F) } },
        { "database", { from_rgb_hex(0x2E5C8A), from_rgb_hex(0x1A3A5C) } },
        { "networking", { from_rgb_hex(0x8B5CF6), from_rgb_hex(0x6D28D9) } },
        { "security", { from_rgb_hex(0xDC2626), from_rgb_hex(0x991B1B) } },
        { "management", { from_rgb_hex(0x0891B2), from_rgb_hex(0x0E7490) } },
        { "cost", { from_rgb_hex(0xF59E0B), from_rgb_hex(0xD97706) } },
        { "messaging", { from_rgb_hex(0xEC4899), from_rgb_hex(0xBE185D) } },
        { "cdn", { from_rgb_hex(0x14B8A6), from_rgb_hex(0x0D9488) } },
        { "devtools", { from_rgb_hex(0x3B82F6), from_rgb_hex(0x1D4ED8) } },
    };
    auto it = colors.find(category);
    if (it != colors.end()) return it->second;
    return { from_rgb_hex(0x666666), from_rgb_hex(0x444444) };
}

} // namespace service_render

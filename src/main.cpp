#include <easel/canvas/canvas_context.h>
#include <easel/core/config.h>
#include <easel/core/diagnostics.h>
#include <easel/raster/pixmap.h>
#include <easel/raster/software_renderer.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <numbers>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using easel::canvas::CanvasContext;
using easel::canvas::CompositionStyle;
using easel::canvas::BlendingStyle;
using easel::canvas::LinearGradientStyle;
using easel::canvas::RadialGradientStyle;
using easel::paint::RGBA;

constexpr const char kDefaultOutputPath[] = "easel.ppm";

enum class OutputFormat { Ppm, Png };

void print_usage(std::ostream& stream) {
    stream << "usage: " << easel::core::config::kProgramName
           << " [output] [--size=WIDTHxHEIGHT] [--format=ppm|png]\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, int& value) {
    if (text.empty()) return false;
    int parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed <= 0) return false;
    value = parsed;
    return true;
}

bool parse_size_flag(std::string_view text, int& width, int& height) {
    constexpr std::string_view kSizePrefix = "--size=";
    if (!starts_with(text, kSizePrefix)) return false;

    const std::string_view dimensions = text.substr(kSizePrefix.size());
    const std::size_t separator = dimensions.find('x');
    if (separator == std::string_view::npos || dimensions.find('x', separator + 1) != std::string_view::npos) {
        return false;
    }

    int parsed_width = 0;
    int parsed_height = 0;
    if (!parse_positive_int(dimensions.substr(0, separator), parsed_width) ||
        !parse_positive_int(dimensions.substr(separator + 1), parsed_height)) {
        return false;
    }
    if (static_cast<std::uint32_t>(parsed_width) > easel::core::config::kMaxPixmapDimension ||
        static_cast<std::uint32_t>(parsed_height) > easel::core::config::kMaxPixmapDimension) {
        return false;
    }
    width = parsed_width;
    height = parsed_height;
    return true;
}

bool parse_format_flag(std::string_view text, OutputFormat& format) {
    constexpr std::string_view kFormatPrefix = "--format=";
    if (!starts_with(text, kFormatPrefix)) return false;
    const std::string_view name = text.substr(kFormatPrefix.size());
    if (name == "ppm") {
        format = OutputFormat::Ppm;
        return true;
    }
    if (name == "png") {
        format = OutputFormat::Png;
        return true;
    }
    return false;
}

// Demo scene scaled to the canvas size.
void draw_scene(CanvasContext& ctx, float width, float height) {
    const float unit = std::min(width, height) / 256.0f;

    ctx.set_fill_style(RGBA{245, 242, 235, 255});
    ctx.fill_rect(0, 0, width, height);

    LinearGradientStyle sky;
    sky.x0 = 0;
    sky.y0 = 0;
    sky.x1 = 0;
    sky.y1 = height * 0.6;
    sky.stops = {{0.0, RGBA{40, 70, 160, 255}}, {1.0, RGBA{250, 190, 120, 255}}};
    ctx.set_fill_style(sky);
    ctx.fill_rect(0, 0, width, height * 0.6f);

    RadialGradientStyle sun;
    sun.x0 = width * 0.7;
    sun.y0 = height * 0.35;
    sun.r0 = 0;
    sun.x1 = sun.x0;
    sun.y1 = sun.y0;
    sun.r1 = 40.0 * unit;
    sun.stops = {{0.0, RGBA{255, 250, 200, 255}},
                 {0.6, RGBA{255, 200, 80, 255}},
                 {1.0, RGBA{255, 160, 60, 0}}};
    ctx.set_fill_style(sun);
    ctx.begin_path();
    ctx.arc(width * 0.7f, height * 0.35f, 40.0f * unit, 0, 2.0f * std::numbers::pi_v<float>, false);
    ctx.fill();

    // Hills clipped to the lower part of the canvas
    ctx.save();
    ctx.begin_path();
    ctx.rect(0, height * 0.45f, width, height * 0.55f);
    ctx.clip();
    ctx.set_fill_style(RGBA{60, 130, 80, 255});
    ctx.begin_path();
    ctx.ellipse(width * 0.3f, height * 0.75f, width * 0.45f, height * 0.25f, 0, 0,
                2.0f * std::numbers::pi_v<float>, false);
    ctx.fill();
    ctx.set_global_composition(BlendingStyle::Multiply);
    ctx.set_fill_style(RGBA{120, 170, 90, 255});
    ctx.begin_path();
    ctx.ellipse(width * 0.8f, height * 0.8f, width * 0.4f, height * 0.2f, 0.2f, 0,
                2.0f * std::numbers::pi_v<float>, false);
    ctx.fill();
    ctx.restore();

    // Star outline
    ctx.save();
    ctx.translate(width * 0.25f, height * 0.25f);
    ctx.rotate(0.1f);
    ctx.begin_path();
    for (int i = 0; i < 10; i++) {
        float r = (i % 2 == 0 ? 30.0f : 12.0f) * unit;
        float a = static_cast<float>(i) * std::numbers::pi_v<float> / 5.0f - std::numbers::pi_v<float> / 2.0f;
        if (i == 0) {
            ctx.move_to(r * std::cos(a), r * std::sin(a));
        } else {
            ctx.line_to(r * std::cos(a), r * std::sin(a));
        }
    }
    ctx.close_path();
    ctx.set_fill_style(RGBA{255, 230, 90, 255});
    ctx.fill();
    ctx.set_line_width(3.0f * unit);
    ctx.set_line_join(easel::paint::LineJoin::Round);
    ctx.set_stroke_style(RGBA{120, 60, 20, 255});
    ctx.stroke();
    ctx.restore();

    // Translucent overlay
    ctx.set_global_alpha(0.5f);
    ctx.set_global_composition(CompositionStyle::SrcOver);
    ctx.set_stroke_style(RGBA{255, 255, 255, 255});
    ctx.set_line_width(6.0f * unit);
    ctx.set_line_cap(easel::paint::LineCap::Round);
    ctx.begin_path();
    ctx.move_to(width * 0.1f, height * 0.9f);
    ctx.bezier_curve_to(width * 0.35f, height * 0.7f, width * 0.65f, height * 1.0f,
                        width * 0.9f, height * 0.85f);
    ctx.stroke();
    ctx.set_global_alpha(1.0f);
}

bool save_png(const easel::canvas::GenericDrawTarget& target, const std::string& path) {
    const auto size = target.get_size();
    std::vector<uint8_t> straight = target.snapshot_owned();
    // PNG stores straight alpha
    for (std::size_t i = 0; i + 3 < straight.size(); i += 4) {
        const uint8_t a = straight[i + 3];
        if (a == 0 || a == 255) continue;
        for (std::size_t c = 0; c < 3; c++) {
            const int v = (straight[i + c] * 255 + a / 2) / a;
            straight[i + c] = static_cast<uint8_t>(std::min(v, 255));
        }
    }
    return stbi_write_png(path.c_str(), size.width, size.height, 4, straight.data(),
                          size.width * 4) != 0;
}

bool save_ppm(const easel::canvas::GenericDrawTarget& target, const std::string& path) {
    const auto size = target.get_size();
    auto pixmap = easel::raster::Pixmap::from_view(easel::raster::PixmapView::from_bytes(
        target.snapshot(), static_cast<std::uint32_t>(size.width),
        static_cast<std::uint32_t>(size.height)));
    return easel::raster::save_ppm(pixmap, path);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc == 2 && is_help_flag(argv[1])) {
        print_usage(std::cout);
        return 0;
    }
    if (argc == 2 && is_version_flag(argv[1])) {
        std::cout << easel::core::config::kVersionString << "\n";
        return 0;
    }

    std::string output_path = kDefaultOutputPath;
    int width = static_cast<int>(easel::core::config::kDefaultRenderWidth);
    int height = static_cast<int>(easel::core::config::kDefaultRenderHeight);
    OutputFormat format = OutputFormat::Ppm;

    std::vector<std::string_view> positional_args;
    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
        if (argument == "--size" || starts_with(argument, "--size=")) {
            if (!parse_size_flag(argument, width, height)) {
                std::cerr << "Invalid --size: '" << argument
                          << "' (expected --size=WIDTHxHEIGHT with positive integers)\n";
                print_usage(std::cerr);
                return 1;
            }
            continue;
        }
        if (argument == "--format" || starts_with(argument, "--format=")) {
            if (!parse_format_flag(argument, format)) {
                std::cerr << "Invalid --format: '" << argument << "' (expected ppm or png)\n";
                print_usage(std::cerr);
                return 1;
            }
            continue;
        }
        positional_args.push_back(argument);
    }

    if (positional_args.size() > 1) {
        print_usage(std::cerr);
        return 1;
    }
    if (!positional_args.empty()) {
        output_path = std::string(positional_args[0]);
    }

    auto diagnostics = std::make_shared<easel::core::DiagnosticEmitter>();
    diagnostics->set_min_severity(easel::core::Severity::Warning);
    diagnostics->add_observer([](const easel::core::DiagnosticEvent& event) {
        std::cerr << easel::core::format_diagnostic(event) << "\n";
    });

    try {
        diagnostics->begin_frame(1);
        CanvasContext ctx({width, height}, diagnostics);
        draw_scene(ctx, static_cast<float>(width), static_cast<float>(height));

        const bool saved = format == OutputFormat::Png ? save_png(ctx.draw_target(), output_path)
                                                       : save_ppm(ctx.draw_target(), output_path);
        if (!saved) {
            std::cerr << "Failed to write " << output_path << "\n";
            return 1;
        }
        if (diagnostics->count(easel::core::Severity::Error) > 0) {
            for (const auto& trace : ctx.failures().traces()) {
                std::cerr << trace.format();
            }
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "Rendered " << width << "x" << height << " to " << output_path << "\n";
    return 0;
}

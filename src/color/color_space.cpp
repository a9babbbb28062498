#include <tincture/color_space.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <eigen3/Eigen/Core>
#include <eigen3/Eigen/LU>
#include <numbers>
#include <string>

namespace tincture
{

namespace
{

using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;

constexpr double GAMUT_EPSILON       = 1e-7;
constexpr int    CHROMA_SEARCH_STEPS = 40;

// ─── sRGB transfer ───────────────────────────────────────────────────────────
// Odd extension so out-of-gamut (negative) channels stay invertible.

double srgb_decode(double c)
{
    const double a   = std::abs(c);
    const double lin = (a <= 0.04045) ? a / 12.92 : std::pow((a + 0.055) / 1.055, 2.4);
    return std::copysign(lin, c);
}

double srgb_encode(double c)
{
    const double a   = std::abs(c);
    const double enc = (a <= 0.0031308) ? a * 12.92 : 1.055 * std::pow(a, 1.0 / 2.4) - 0.055;
    return std::copysign(enc, c);
}

Vec3 decode(const Vec3& rgb)
{
    return {srgb_decode(rgb.x()), srgb_decode(rgb.y()), srgb_decode(rgb.z())};
}

Vec3 encode(const Vec3& lin)
{
    return {srgb_encode(lin.x()), srgb_encode(lin.y()), srgb_encode(lin.z())};
}

// Linear sRGB -> CIE XYZ (D65).
const Mat3& rgb_to_xyz()
{
    static const Mat3 m = (Mat3() << 0.4124564, 0.3575761, 0.1804375,
                                     0.2126729, 0.7151522, 0.0721750,
                                     0.0193339, 0.1191920, 0.9503041)
                              .finished();
    return m;
}

const Mat3& xyz_to_rgb()
{
    static const Mat3 m = rgb_to_xyz().inverse();
    return m;
}

// ─── CIE Lab ─────────────────────────────────────────────────────────────────

constexpr double LAB_DELTA = 6.0 / 29.0;

// Reference white is the image of RGB (1,1,1) so neutral grays get a = b = 0.
const Vec3& lab_white()
{
    static const Vec3 w = rgb_to_xyz() * Vec3::Ones();
    return w;
}

double lab_f(double t)
{
    return (t > LAB_DELTA * LAB_DELTA * LAB_DELTA)
               ? std::cbrt(t)
               : t / (3.0 * LAB_DELTA * LAB_DELTA) + 4.0 / 29.0;
}

double lab_f_inv(double t)
{
    return (t > LAB_DELTA) ? t * t * t : 3.0 * LAB_DELTA * LAB_DELTA * (t - 4.0 / 29.0);
}

Coords lab_from_rgb(const Vec3& rgb)
{
    const Vec3  xyz = rgb_to_xyz() * decode(rgb);
    const Vec3& w   = lab_white();
    const double fx = lab_f(xyz.x() / w.x());
    const double fy = lab_f(xyz.y() / w.y());
    const double fz = lab_f(xyz.z() / w.z());
    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Vec3 lab_to_rgb(const Coords& c)
{
    const Vec3&  w  = lab_white();
    const double fy = (c[0] + 16.0) / 116.0;
    const double fx = fy + c[1] / 500.0;
    const double fz = fy - c[2] / 200.0;
    const Vec3   xyz(w.x() * lab_f_inv(fx), w.y() * lab_f_inv(fy), w.z() * lab_f_inv(fz));
    return encode(xyz_to_rgb() * xyz);
}

// ─── Oklab ───────────────────────────────────────────────────────────────────

const Mat3& oklab_m1()
{
    static const Mat3 m = (Mat3() << 0.4122214708, 0.5363325363, 0.0514459929,
                                     0.2119034982, 0.6806995451, 0.1073969566,
                                     0.0883024619, 0.2817188376, 0.6299787005)
                              .finished();
    return m;
}

const Mat3& oklab_m2()
{
    static const Mat3 m = (Mat3() << 0.2104542553, 0.7936177850, -0.0040720468,
                                     1.9779984951, -2.4285922050, 0.4505937099,
                                     0.0259040371, 0.7827717662, -0.8086757660)
                              .finished();
    return m;
}

const Mat3& oklab_m1_inv()
{
    static const Mat3 m = oklab_m1().inverse();
    return m;
}

const Mat3& oklab_m2_inv()
{
    static const Mat3 m = oklab_m2().inverse();
    return m;
}

Coords oklab_from_rgb(const Vec3& rgb)
{
    const Vec3 lms_lin = oklab_m1() * decode(rgb);
    const Vec3 lms     = lms_lin.unaryExpr([](double v) { return std::cbrt(v); });
    const Vec3 lab     = oklab_m2() * lms;
    return {lab.x(), lab.y(), lab.z()};
}

Vec3 oklab_to_rgb(const Coords& c)
{
    const Vec3 lms_ = oklab_m2_inv() * Vec3(c[0], c[1], c[2]);
    const Vec3 lms  = lms_.cwiseProduct(lms_).cwiseProduct(lms_);
    return encode(oklab_m1_inv() * lms);
}

// ─── JzAzBz (Safdar et al. 2017) ─────────────────────────────────────────────

constexpr double JZ_B  = 1.15;
constexpr double JZ_G  = 0.66;
constexpr double JZ_C1 = 3424.0 / 4096.0;
constexpr double JZ_C2 = 2413.0 / 128.0;
constexpr double JZ_C3 = 2392.0 / 128.0;
constexpr double JZ_N  = 2610.0 / 16384.0;
constexpr double JZ_P  = 1.7 * 2523.0 / 32.0;
constexpr double JZ_D  = -0.56;
constexpr double JZ_D0 = 1.6295499532821566e-11;

const Mat3& jz_m1()
{
    static const Mat3 m = (Mat3() << 0.41478972, 0.579999, 0.0146480,
                                     -0.2015100, 1.120649, 0.0531008,
                                     -0.0166008, 0.264800, 0.6684799)
                              .finished();
    return m;
}

const Mat3& jz_m2()
{
    static const Mat3 m = (Mat3() << 0.5, 0.5, 0.0,
                                     3.524000, -4.066708, 0.542708,
                                     0.199076, 1.096799, -1.295875)
                              .finished();
    return m;
}

const Mat3& jz_m1_inv()
{
    static const Mat3 m = jz_m1().inverse();
    return m;
}

const Mat3& jz_m2_inv()
{
    static const Mat3 m = jz_m2().inverse();
    return m;
}

// PQ-style compression of an absolute (cd/m²) cone response.
double pq_encode(double x)
{
    const double xp = std::pow(std::abs(x) / 10000.0, JZ_N);
    return std::copysign(std::pow((JZ_C1 + JZ_C2 * xp) / (1.0 + JZ_C3 * xp), JZ_P), x);
}

double pq_decode(double v)
{
    const double vp    = std::pow(std::abs(v), 1.0 / JZ_P);
    const double ratio = (JZ_C1 - vp) / (JZ_C3 * vp - JZ_C2);
    return std::copysign(10000.0 * std::pow(std::max(ratio, 0.0), 1.0 / JZ_N), v);
}

double effective_white(const ConversionOptions& options)
{
    return (std::isfinite(options.hdr_white) && options.hdr_white > 0.0) ? options.hdr_white
                                                                         : DEFAULT_HDR_WHITE;
}

Coords jzazbz_from_rgb(const Vec3& rgb, const ConversionOptions& options)
{
    const Vec3   xyz = (rgb_to_xyz() * decode(rgb)) * effective_white(options);
    const double xp  = JZ_B * xyz.x() - (JZ_B - 1.0) * xyz.z();
    const double yp  = JZ_G * xyz.y() - (JZ_G - 1.0) * xyz.x();
    const Vec3   lms_abs = jz_m1() * Vec3(xp, yp, xyz.z());
    const Vec3   lms     = lms_abs.unaryExpr([](double v) { return pq_encode(v); });
    const Vec3   iab     = jz_m2() * lms;
    const double iz  = iab.x();
    const double jz  = ((1.0 + JZ_D) * iz) / (1.0 + JZ_D * iz) - JZ_D0;
    return {jz, iab.y(), iab.z()};
}

Vec3 jzazbz_to_rgb(const Coords& c, const ConversionOptions& options)
{
    const double iz_d = c[0] + JZ_D0;
    const double iz   = iz_d / (1.0 + JZ_D - JZ_D * iz_d);
    const Vec3   lms_ = jz_m2_inv() * Vec3(iz, c[1], c[2]);
    const Vec3   lms  = lms_.unaryExpr([](double v) { return pq_decode(v); });
    const Vec3   xyzp = jz_m1_inv() * lms;
    const double z    = xyzp.z();
    const double x    = (xyzp.x() + (JZ_B - 1.0) * z) / JZ_B;
    const double y    = (xyzp.y() + (JZ_G - 1.0) * x) / JZ_G;
    return encode(xyz_to_rgb() * (Vec3(x, y, z) / effective_white(options)));
}

// ─── HSV ─────────────────────────────────────────────────────────────────────

Coords hsv_from_rgb(const Vec3& rgb)
{
    const double r     = rgb.x();
    const double g     = rgb.y();
    const double b     = rgb.z();
    const double max_c = std::max({r, g, b});
    const double min_c = std::min({r, g, b});
    const double d     = max_c - min_c;

    double h = 0.0;
    if (d > 0.0)
    {
        if (max_c == r)
            h = (g - b) / d + (g < b ? 6.0 : 0.0);
        else if (max_c == g)
            h = (b - r) / d + 2.0;
        else
            h = (r - g) / d + 4.0;
    }
    const double s = (max_c > 0.0) ? d / max_c : 0.0;
    return {normalize_hue(h * 60.0), s, max_c};
}

Vec3 hsv_to_rgb(const Coords& c)
{
    const double h      = normalize_hue(c[0]);
    const double s      = c[1];
    const double v      = c[2];
    const double chroma = v * s;
    const double hp     = h / 60.0;
    const double x      = chroma * (1.0 - std::abs(std::fmod(hp, 2.0) - 1.0));
    const double m      = v - chroma;

    switch (static_cast<int>(hp))
    {
        case 0:
            return {chroma + m, x + m, m};
        case 1:
            return {x + m, chroma + m, m};
        case 2:
            return {m, chroma + m, x + m};
        case 3:
            return {m, x + m, chroma + m};
        case 4:
            return {x + m, m, chroma + m};
        default:
            return {chroma + m, m, x + m};
    }
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

Vec3 space_to_rgb(ColorSpace space, const Coords& c, const ConversionOptions& options)
{
    switch (space)
    {
        case ColorSpace::CieLab:
            return lab_to_rgb(c);
        case ColorSpace::Oklab:
            return oklab_to_rgb(c);
        case ColorSpace::JzAzBz:
            return jzazbz_to_rgb(c, options);
        case ColorSpace::Hsv:
            return hsv_to_rgb(c);
    }
    return Vec3::Zero();
}

Coords space_from_rgb(ColorSpace space, const Vec3& rgb, const ConversionOptions& options)
{
    switch (space)
    {
        case ColorSpace::CieLab:
            return lab_from_rgb(rgb);
        case ColorSpace::Oklab:
            return oklab_from_rgb(rgb);
        case ColorSpace::JzAzBz:
            return jzazbz_from_rgb(rgb, options);
        case ColorSpace::Hsv:
            return hsv_from_rgb(rgb);
    }
    return {};
}

size_t lightness_index(ColorSpace space)
{
    return space == ColorSpace::Hsv ? 2 : 0;
}

// Scales the chroma-like components by `t` in [0, 1]; hue and lightness untouched.
Coords scale_chroma(ColorSpace space, const Coords& c, double t)
{
    if (space == ColorSpace::Hsv)
        return {c[0], c[1] * t, c[2]};
    return {c[0], c[1] * t, c[2] * t};
}

bool fits(const Vec3& rgb)
{
    for (int i = 0; i < 3; ++i)
    {
        if (!std::isfinite(rgb[i]) || rgb[i] < -GAMUT_EPSILON || rgb[i] > 1.0 + GAMUT_EPSILON)
            return false;
    }
    return true;
}

uint8_t quantize(double c)
{
    if (!std::isfinite(c))
        c = (c > 0.0) ? 1.0 : 0.0;
    return static_cast<uint8_t>(std::lround(std::clamp(c, 0.0, 1.0) * 255.0));
}

// Rounding each channel on its own can turn a low-chroma color by several
// degrees. Of the floor/ceil neighbours of `rgb`, keep the one whose hue is
// closest to `target`; ties go to plain rounding.
Rgb8 quantize_keeping_hue(ColorSpace               space,
                          const Vec3&              rgb,
                          const Lch&               target,
                          const ConversionOptions& options)
{
    Rgb8 best{quantize(rgb.x()), quantize(rgb.y()), quantize(rgb.z())};
    if (!(target.chroma > 0.0))
        return best;

    const auto hue_error = [&](const Rgb8& q)
    {
        const Lch lch = to_polar(space, from_srgb(space, q, options));
        return lch.chroma > 0.0 ? hue_distance(lch.hue, target.hue) : 360.0;
    };

    // A channel within CODE_SNAP of a code value stays on it, so clamped
    // white and black are never nudged off the cube corner.
    constexpr double CODE_SNAP = 1e-3;

    uint8_t steps[3][2];
    for (int i = 0; i < 3; ++i)
    {
        const double v  = std::clamp(std::isfinite(rgb[i]) ? rgb[i] : 0.0, 0.0, 1.0) * 255.0;
        double       lo = std::floor(v);
        double       hi = std::ceil(v);
        if (v - lo < CODE_SNAP)
            hi = lo;
        else if (hi - v < CODE_SNAP)
            lo = hi;
        steps[i][0] = static_cast<uint8_t>(lo);
        steps[i][1] = static_cast<uint8_t>(hi);
    }

    double best_error = hue_error(best);
    for (int n = 0; n < 8; ++n)
    {
        const Rgb8   candidate{steps[0][(n >> 2) & 1], steps[1][(n >> 1) & 1], steps[2][n & 1]};
        const double error = hue_error(candidate);
        if (error < best_error - 1e-12)
        {
            best       = candidate;
            best_error = error;
        }
    }
    return best;
}

// NaN -> 0, infinities -> a finite value far outside every gamut.
double sanitize(double v)
{
    constexpr double LIMIT = 1e6;
    return std::isnan(v) ? 0.0 : std::clamp(v, -LIMIT, LIMIT);
}

Coords sanitize(const Coords& c)
{
    return {sanitize(c[0]), sanitize(c[1]), sanitize(c[2])};
}

double to_degrees(double rad)
{
    return rad * 180.0 / std::numbers::pi;
}

double to_radians(double deg)
{
    return deg * std::numbers::pi / 180.0;
}

}   // namespace

// ─── Names ───────────────────────────────────────────────────────────────────

const char* color_space_name(ColorSpace space)
{
    switch (space)
    {
        case ColorSpace::CieLab:
            return "cielab";
        case ColorSpace::Oklab:
            return "oklab";
        case ColorSpace::JzAzBz:
            return "jzazbz";
        case ColorSpace::Hsv:
            return "hsv";
    }
    return "unknown";
}

std::optional<ColorSpace> parse_color_space(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "lab" || lower == "cielab")
        return ColorSpace::CieLab;
    if (lower == "oklab")
        return ColorSpace::Oklab;
    if (lower == "jzazbz")
        return ColorSpace::JzAzBz;
    if (lower == "hsv")
        return ColorSpace::Hsv;
    return std::nullopt;
}

// ─── Conversions ─────────────────────────────────────────────────────────────

Rgb8 to_srgb(ColorSpace space, const Coords& coords, const ConversionOptions& options)
{
    Coords c = sanitize(coords);

    const LightnessRange range = lightness_range(space, options);
    const size_t         li    = lightness_index(space);
    c[li]                      = std::clamp(c[li], range.black, range.white);

    const Vec3 rgb = space_to_rgb(space, c, options);
    if (fits(rgb))
        return {quantize(rgb.x()), quantize(rgb.y()), quantize(rgb.z())};

    // Largest chroma scale that still fits. At t = 0 the color is the
    // neutral of the same lightness, which always fits.
    double lo = 0.0;
    double hi = 1.0;
    for (int i = 0; i < CHROMA_SEARCH_STEPS; ++i)
    {
        const double mid = 0.5 * (lo + hi);
        if (fits(space_to_rgb(space, scale_chroma(space, c, mid), options)))
            lo = mid;
        else
            hi = mid;
    }
    return quantize_keeping_hue(
        space, space_to_rgb(space, scale_chroma(space, c, lo), options), to_polar(space, c), options);
}

Coords from_srgb(ColorSpace space, Rgb8 rgb, const ConversionOptions& options)
{
    const Vec3 encoded(rgb.r / 255.0, rgb.g / 255.0, rgb.b / 255.0);
    return space_from_rgb(space, encoded, options);
}

Coords convert(ColorSpace from, ColorSpace to, const Coords& coords, const ConversionOptions& options)
{
    if (from == to)
        return coords;
    return space_from_rgb(to, space_to_rgb(from, coords, options), options);
}

bool in_gamut(ColorSpace space, const Coords& coords, const ConversionOptions& options)
{
    return fits(space_to_rgb(space, coords, options));
}

Lch to_polar(ColorSpace space, const Coords& coords)
{
    if (space == ColorSpace::Hsv)
        return {coords[2], coords[1], normalize_hue(coords[0])};

    const double chroma = std::hypot(coords[1], coords[2]);
    const double hue    = chroma > 0.0 ? normalize_hue(to_degrees(std::atan2(coords[2], coords[1])))
                                       : 0.0;
    return {coords[0], chroma, hue};
}

Coords from_polar(ColorSpace space, const Lch& lch)
{
    const double chroma = std::max(lch.chroma, 0.0);
    if (space == ColorSpace::Hsv)
        return {normalize_hue(lch.hue), chroma, lch.lightness};

    const double h = to_radians(lch.hue);
    return {lch.lightness, chroma * std::cos(h), chroma * std::sin(h)};
}

LightnessRange lightness_range(ColorSpace space, const ConversionOptions& options)
{
    if (space == ColorSpace::Hsv)
        return {0.0, 1.0};

    const size_t li = lightness_index(space);
    return {space_from_rgb(space, Vec3::Zero(), options)[li],
            space_from_rgb(space, Vec3::Ones(), options)[li]};
}

double normalize_hue(double degrees)
{
    if (!std::isfinite(degrees))
        return 0.0;
    double h = std::fmod(degrees, 360.0);
    if (h < 0.0)
        h += 360.0;
    if (h >= 360.0)
        h -= 360.0;
    return h;
}

double hue_distance(double a, double b)
{
    const double d = std::abs(normalize_hue(a) - normalize_hue(b));
    return std::min(d, 360.0 - d);
}

}   // namespace tincture

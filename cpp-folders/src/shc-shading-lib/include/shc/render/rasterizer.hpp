#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Fixed-function шатуудын CPU хувилбар: frustum clip, face culling,
            perspective-correct varying interpolation, depth test, color write.
            Pixel (0,0) нь зүүн доод буланд байрлана.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "shc/gfx/rt_types.hpp"
#include "shc/job/parallel_for.hpp"
#include "shc/rhi/pipeline_desc.hpp"
#include "shc/shader/types.hpp"

namespace shc
{
    struct RasterizerConfig
    {
        RHICullMode cull_mode = RHICullMode::Back;
        RHIFrontFace front_face = RHIFrontFace::CCW;
        RHIClipDepth clip_depth = RHIClipDepth::ZeroToOne;
        bool depth_test = true;
        bool depth_write = true;
        IJobSystem* job_system = nullptr;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 128 * 128;
    };

    struct RasterizerTarget
    {
        RT_ColorHDR* color = nullptr;
        // nullptr бол depth test хийхгүй.
        RT_DepthBuffer* depth = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t fragments_shaded = 0;

        void accumulate(const RasterizerStats& o)
        {
            tri_input += o.tri_input;
            tri_after_clip += o.tri_after_clip;
            tri_raster += o.tri_raster;
            fragments_shaded += o.fragments_shaded;
        }
    };

    namespace detail
    {
        struct RasterVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
            std::array<glm::vec4, SHC_MAX_VARYINGS> varyings{};
            uint32_t varying_mask = 0u;
        };

        inline RasterVertex to_raster_vertex(const VertexOut& v)
        {
            return RasterVertex{v.clip, v.varyings, v.varying_mask};
        }

        inline RasterVertex lerp_rv(const RasterVertex& a, const RasterVertex& b, float t)
        {
            RasterVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.varying_mask = a.varying_mask | b.varying_mask;
            for (uint32_t i = 0; i < SHC_MAX_VARYINGS; ++i) o.varyings[i] = glm::mix(a.varyings[i], b.varyings[i], t);
            return o;
        }

        inline float plane_dist_left(const RasterVertex& v) { return v.clip.x + v.clip.w; }
        inline float plane_dist_right(const RasterVertex& v) { return v.clip.w - v.clip.x; }
        inline float plane_dist_bottom(const RasterVertex& v) { return v.clip.y + v.clip.w; }
        inline float plane_dist_top(const RasterVertex& v) { return v.clip.w - v.clip.y; }
        inline float plane_dist_near_zero_one(const RasterVertex& v) { return v.clip.z; }
        inline float plane_dist_near_neg_one(const RasterVertex& v) { return v.clip.z + v.clip.w; }
        inline float plane_dist_far(const RasterVertex& v) { return v.clip.w - v.clip.z; }

        template <typename PlaneDistFn>
        inline std::vector<RasterVertex> clip_polygon_plane(const std::vector<RasterVertex>& in_poly, PlaneDistFn plane_dist_fn)
        {
            std::vector<RasterVertex> out{};
            if (in_poly.empty()) return out;

            out.reserve(in_poly.size() + 2);
            for (size_t i = 0; i < in_poly.size(); ++i)
            {
                const RasterVertex& cur = in_poly[i];
                const RasterVertex& nxt = in_poly[(i + 1) % in_poly.size()];
                const float da = plane_dist_fn(cur);
                const float db = plane_dist_fn(nxt);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in && nxt_in)
                {
                    out.push_back(nxt);
                }
                else if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_rv(cur, nxt, da / denom));
                    if (nxt_in) out.push_back(nxt);
                }
            }
            return out;
        }

        inline std::vector<RasterVertex> clip_polygon_frustum(const std::vector<RasterVertex>& in_poly, RHIClipDepth depth)
        {
            std::vector<RasterVertex> poly = in_poly;
            poly = clip_polygon_plane(poly, plane_dist_left);
            poly = clip_polygon_plane(poly, plane_dist_right);
            poly = clip_polygon_plane(poly, plane_dist_bottom);
            poly = clip_polygon_plane(poly, plane_dist_top);
            if (depth == RHIClipDepth::ZeroToOne) poly = clip_polygon_plane(poly, plane_dist_near_zero_one);
            else poly = clip_polygon_plane(poly, plane_dist_near_neg_one);
            poly = clip_polygon_plane(poly, plane_dist_far);
            return poly;
        }

        inline bool fully_inside_clip(const RasterVertex& rv, RHIClipDepth depth)
        {
            const glm::vec4 c = rv.clip;
            if (!(c.w > 0.0f)) return false;
            const float z_min = depth == RHIClipDepth::ZeroToOne ? 0.0f : -c.w;
            return
                (c.x >= -c.w && c.x <= c.w) &&
                (c.y >= -c.w && c.y <= c.w) &&
                (c.z >= z_min && c.z <= c.w);
        }

        inline float ndc_depth_to_01(float z_ndc, RHIClipDepth depth)
        {
            const float z = depth == RHIClipDepth::ZeroToOne ? z_ndc : z_ndc * 0.5f + 0.5f;
            return glm::clamp(z, 0.0f, 1.0f);
        }

        inline bool finite3(const glm::vec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-8f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        const float u = 1.0f - v - w;
        return glm::vec3(u, v, w);
    }

    // Нэг triangle-ийг clip хийж, бүрхсэн pixel бүрд fs-ийг дуудна.
    // FragmentFn: FragmentOut(const FragmentIn&)
    template<typename FragmentFn>
    inline RasterizerStats rasterize_triangle(
        const VertexOut& v0,
        const VertexOut& v1,
        const VertexOut& v2,
        FragmentFn&& fs,
        RasterizerTarget target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target.color) return stats;
        const int W = target.color->w;
        const int H = target.color->h;
        if (W <= 0 || H <= 0) return stats;
        if (target.depth && (target.depth->w != W || target.depth->h != H)) return stats;
        stats.tri_input++;

        std::vector<detail::RasterVertex> poly = {
            detail::to_raster_vertex(v0), detail::to_raster_vertex(v1), detail::to_raster_vertex(v2)
        };
        // Ихэнх triangle clip volume дотор байдаг тул clip-ийг алгасна.
        if (!(detail::fully_inside_clip(poly[0], config.clip_depth) &&
              detail::fully_inside_clip(poly[1], config.clip_depth) &&
              detail::fully_inside_clip(poly[2], config.clip_depth)))
        {
            poly = detail::clip_polygon_frustum(poly, config.clip_depth);
        }
        if (poly.size() < 3) return stats;

        std::atomic<uint64_t> shaded{0};

        // Clip хийсний дараах олон өнцөгтийг fan аргаар гурвалжилна.
        for (size_t k = 1; k + 1 < poly.size(); ++k)
        {
            stats.tri_after_clip++;
            const detail::RasterVertex& rv0 = poly[0];
            const detail::RasterVertex& rv1 = poly[k];
            const detail::RasterVertex& rv2 = poly[k + 1];

            const glm::vec3 n0 = glm::vec3(rv0.clip) / rv0.clip.w;
            const glm::vec3 n1 = glm::vec3(rv1.clip) / rv1.clip.w;
            const glm::vec3 n2 = glm::vec3(rv2.clip) / rv2.clip.w;
            if (!detail::finite3(n0) || !detail::finite3(n1) || !detail::finite3(n2)) continue;

            const glm::vec2 s0{(n0.x * 0.5f + 0.5f) * (float)W, (n0.y * 0.5f + 0.5f) * (float)H};
            const glm::vec2 s1{(n1.x * 0.5f + 0.5f) * (float)W, (n1.y * 0.5f + 0.5f) * (float)H};
            const glm::vec2 s2{(n2.x * 0.5f + 0.5f) * (float)W, (n2.y * 0.5f + 0.5f) * (float)H};

            const glm::vec2 e0 = s1 - s0;
            const glm::vec2 e1 = s2 - s0;
            const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
            if (std::abs(signed_area2) < 1e-10f) continue;
            const bool tri_ccw = signed_area2 > 0.0f;
            const bool is_front = (tri_ccw == (config.front_face == RHIFrontFace::CCW));
            if (config.cull_mode == RHICullMode::Back && !is_front) continue;
            if (config.cull_mode == RHICullMode::Front && is_front) continue;

            const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
            const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
            const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
            const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
            if (minx > maxx || miny > maxy) continue;
            stats.tri_raster++;

            const float invw0 = 1.0f / rv0.clip.w;
            const float invw1 = 1.0f / rv1.clip.w;
            const float invw2 = 1.0f / rv2.clip.w;
            const uint32_t varying_mask = rv0.varying_mask | rv1.varying_mask | rv2.varying_mask;
            std::array<glm::vec4, SHC_MAX_VARYINGS> varw0{};
            std::array<glm::vec4, SHC_MAX_VARYINGS> varw1{};
            std::array<glm::vec4, SHC_MAX_VARYINGS> varw2{};
            for (uint32_t i = 0; i < SHC_MAX_VARYINGS; ++i)
            {
                if ((varying_mask & varying_bit(i)) == 0u) continue;
                varw0[i] = rv0.varyings[i] * invw0;
                varw1[i] = rv1.varyings[i] * invw1;
                varw2[i] = rv2.varyings[i] * invw2;
            }

            auto raster_rows = [&](int yb, int ye)
            {
                uint64_t local_shaded = 0;
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = minx; x <= maxx; ++x)
                    {
                        const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                        const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                        if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                        // 1/w interpolation: perspective-correct varying.
                        const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                        if (denom <= 1e-10f) continue;
                        const float inv_denom = 1.0f / denom;

                        // NDC z нь screen space-д шугаман тул шууд barycentric-ээр.
                        const float z_ndc = bc.x * n0.z + bc.y * n1.z + bc.z * n2.z;
                        const float z01 = detail::ndc_depth_to_01(z_ndc, config.clip_depth);
                        if (target.depth && config.depth_test)
                        {
                            if (!target.depth->passes(x, y, z01)) continue;
                        }

                        FragmentIn fin{};
                        fin.varying_mask = varying_mask;
                        for (uint32_t i = 0; i < SHC_MAX_VARYINGS; ++i)
                        {
                            if ((varying_mask & varying_bit(i)) == 0u) continue;
                            fin.varyings[i] = (bc.x * varw0[i] + bc.y * varw1[i] + bc.z * varw2[i]) * inv_denom;
                        }
                        fin.depth01 = z01;
                        fin.px = x;
                        fin.py = y;

                        const FragmentOut fout = fs(fin);
                        local_shaded++;
                        if (fout.discard) continue;

                        target.color->color.at(x, y) = fout.color;
                        if (target.depth && config.depth_write) target.depth->write(x, y, z01);
                    }
                }
                shaded.fetch_add(local_shaded, std::memory_order_relaxed);
            };

            const int bbox_rows = maxy - miny + 1;
            const int bbox_pixels = (maxx - minx + 1) * bbox_rows;
            // Том bbox дээр л parallel замыг асааж scheduling overhead-оос зайлсхийнэ.
            // Мөр бүр зөвхөн өөрийн pixel-үүдийг бичих тул depth test race-гүй.
            const bool use_parallel =
                config.job_system &&
                bbox_rows >= std::max(1, config.parallel_min_rows) &&
                bbox_pixels >= std::max(1, config.parallel_min_pixels);
            if (use_parallel)
            {
                parallel_for_1d(config.job_system, miny, maxy + 1, std::max(1, config.parallel_min_rows), raster_rows);
            }
            else
            {
                raster_rows(miny, maxy + 1);
            }
        }

        stats.fragments_shaded = shaded.load(std::memory_order_relaxed);
        return stats;
    }
}

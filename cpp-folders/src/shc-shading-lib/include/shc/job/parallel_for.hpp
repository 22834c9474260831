#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: [begin, end) мужийг тасралтгүй хэсгүүдэд хувааж job system дээр ажиллуулна.
            Vertex invocation болон raster мөрүүдэд хэрэглэнэ.
*/


#include <algorithm>
#include <cstddef>
#include <vector>

#include "shc/job/job_system.hpp"

namespace shc
{
    struct IndexRange
    {
        int begin = 0;
        int end = 0;
    };

    // Хэсэг бүр min_grain-ээс багагүй, хэсгийн тоо worker * 2-оос хэтрэхгүй.
    // Хэсгүүд давхцалгүй бөгөөд [begin, end)-ийг дарааллаар нь бүрэн бүрхэнэ.
    inline std::vector<IndexRange> split_index_range(int begin, int end, int min_grain, size_t workers)
    {
        std::vector<IndexRange> out{};
        if (end <= begin) return out;

        const int count = end - begin;
        const int grain = std::max(1, min_grain);
        const int max_chunks = (int)std::max<size_t>(1, workers) * 2;
        const int chunks = std::clamp((count + grain - 1) / grain, 1, max_chunks);
        const int chunk_size = (count + chunks - 1) / chunks;

        out.reserve((size_t)chunks);
        for (int b = begin; b < end; b += chunk_size)
        {
            out.push_back(IndexRange{b, std::min(end, b + chunk_size)});
        }
        return out;
    }

    // fn(int b, int e). Job system байхгүй эсвэл нэг хэсэгт багтвал дуудагч thread дээр ажиллана.
    template<typename Fn>
    inline void parallel_for_1d(IJobSystem* js, int begin, int end, int min_grain, Fn&& fn)
    {
        if (end <= begin) return;
        if (!js)
        {
            fn(begin, end);
            return;
        }

        const std::vector<IndexRange> ranges = split_index_range(begin, end, min_grain, js->worker_count());
        if (ranges.size() == 1)
        {
            fn(begin, end);
            return;
        }

        WaitGroup wg{};
        wg.add((int)ranges.size() - 1);
        for (size_t i = 1; i < ranges.size(); ++i)
        {
            const IndexRange r = ranges[i];
            js->enqueue([r, &fn, &wg]() {
                fn(r.begin, r.end);
                wg.done();
            });
        }
        // Эхний хэсгийг дуудагч thread өөрөө гүйцэтгэнэ.
        fn(ranges[0].begin, ranges[0].end);
        wg.wait();
    }
}

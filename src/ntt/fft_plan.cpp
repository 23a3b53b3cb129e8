#include "ntt/fft_plan.hpp"

#include <sstream>

namespace gpu_poly {

std::vector<LadderStep> plan_fft_ladder(size_t n) {
    check_transform_size(n);

    std::vector<LadderStep> ladder;
    size_t num_boxes = 1;
    while (n / num_boxes > gpu::kFftTileSize) {
        ladder.push_back({num_boxes, FftVariant::Single, 1});
        num_boxes *= 2;
    }
    ladder.push_back({num_boxes, FftVariant::Multiple, log2_exact(n / num_boxes)});
    return ladder;
}

std::string describe_ladder(const std::vector<LadderStep>& ladder) {
    std::ostringstream oss;
    for (size_t i = 0; i < ladder.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << to_string(ladder[i].variant) << "(" << ladder[i].num_boxes;
        if (ladder[i].stages > 1) {
            oss << ", x" << ladder[i].stages;
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace gpu_poly

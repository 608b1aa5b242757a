#ifndef MEDCAP_DATA_TRANSFORM_FORMAT_HPP
#define MEDCAP_DATA_TRANSFORM_FORMAT_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>
#include <torch/nn/functional.h>

namespace Medcap::Data::Transform::Format {
    namespace Options {

        enum class InterpMode {
            Bilinear,
            Nearest,
            Bicubic,
            Area,
        };

        struct ScaleOptions {
            std::vector<int64_t> size{};
            InterpMode interp = InterpMode::Area;
        };
    }

    // Output geometry of Square(): the resized extent plus the zero bands around it.
    struct SquarePlan {
        int64_t height{0};
        int64_t width{0};
        int64_t pad_top{0};
        int64_t pad_bottom{0};
        int64_t pad_left{0};
        int64_t pad_right{0};
    };

    namespace Details {

        inline torch::Tensor to_float32(const torch::Tensor& tensor) {
            if (tensor.scalar_type() == torch::kFloat32) {
                return tensor;
            }
            return tensor.to(tensor.options().dtype(torch::kFloat32));
        }

        inline torch::Tensor resize_spatial(
                const torch::Tensor& tensor,
                const std::vector<int64_t>& target_size,
                Options::InterpMode interp_mode) {

            if (tensor.dim() < 2)
                throw std::invalid_argument("Format::resize_spatial expects (H,W), (C,H,W) or (N,C,H,W).");
            if (target_size.size() != 2 || target_size[0] <= 0 || target_size[1] <= 0)
                throw std::invalid_argument("Format::resize_spatial expects positive H,W.");

            auto working = tensor;
            int64_t added_dims = 0;
            while (working.dim() < 4) {
                working = working.unsqueeze(0);
                ++added_dims;
            }
            if (working.dim() != 4) {
                throw std::invalid_argument("Format::resize_spatial supports 2D, 3D or 4D tensors.");
            }

            auto opts = torch::nn::functional::InterpolateFuncOptions()
                            .size(std::vector<int64_t>{target_size[0], target_size[1]});

            switch (interp_mode) {
                case Options::InterpMode::Bilinear:
                    opts = opts.mode(torch::kBilinear).align_corners(false);
                    break;
                case Options::InterpMode::Nearest:
                    opts = opts.mode(torch::kNearest);
                    break;
                case Options::InterpMode::Bicubic:
                    opts = opts.mode(torch::kBicubic).align_corners(false);
                    break;
                case Options::InterpMode::Area:
                    opts = opts.mode(torch::kArea);
                    break;
            }

            auto resized = torch::nn::functional::interpolate(working, opts);
            for (int64_t i = 0; i < added_dims; ++i) {
                resized = resized.squeeze(0);
            }
            return resized;
        }
    }

    inline torch::Tensor Resize(const torch::Tensor& tensor, const Options::ScaleOptions& options) {
        if (!tensor.defined()) {
            throw std::invalid_argument("Format::Resize expects a defined tensor.");
        }
        if (options.size.size() != 2) {
            throw std::invalid_argument("Format::Resize expects a (H,W) size.");
        }
        const auto height = tensor.size(-2);
        const auto width = tensor.size(-1);
        if (height == options.size[0] && width == options.size[1]) {
            return Details::to_float32(tensor);
        }
        return Details::resize_spatial(Details::to_float32(tensor), options.size, options.interp);
    }

    /**
     * Geometry of an aspect-preserving fit into target x target. The longer side (height on ties)
     * becomes `target`; the shorter one becomes floor(shorter * target / longer), at least one pixel.
     * The shorter axis is then zero-padded with floor(pad / 2) before and ceil(pad / 2) after.
     */
    [[nodiscard]] inline SquarePlan PlanSquare(int64_t height, int64_t width, int64_t target) {
        if (height <= 0 || width <= 0) {
            throw std::invalid_argument("Format::PlanSquare expects a non-empty image.");
        }
        if (target <= 0) {
            throw std::invalid_argument("Format::PlanSquare expects a positive target size.");
        }

        SquarePlan plan;
        if (height >= width) {
            plan.height = target;
            plan.width = std::max<int64_t>(1, (width * target) / height);
            const auto pad = target - plan.width;
            plan.pad_left = pad / 2;
            plan.pad_right = pad - plan.pad_left;
        } else {
            plan.width = target;
            plan.height = std::max<int64_t>(1, (height * target) / width);
            const auto pad = target - plan.height;
            plan.pad_top = pad / 2;
            plan.pad_bottom = pad - plan.pad_top;
        }
        return plan;
    }

    // Area-averaged aspect-preserving resize followed by zero padding to target x target.
    // Accepts (H,W), (C,H,W) or (N,C,H,W); returns float32 with the same leading dimensions.
    [[nodiscard]] inline torch::Tensor Square(const torch::Tensor& image, int64_t target) {
        if (!image.defined() || image.dim() < 2 || image.dim() > 4) {
            throw std::invalid_argument("Format::Square expects a defined (H,W), (C,H,W) or (N,C,H,W) tensor.");
        }

        const auto plan = PlanSquare(image.size(-2), image.size(-1), target);
        auto resized = Resize(image, {.size = {plan.height, plan.width}, .interp = Options::InterpMode::Area});
        return torch::constant_pad_nd(resized, {plan.pad_left, plan.pad_right, plan.pad_top, plan.pad_bottom}, 0);
    }
}

#endif // MEDCAP_DATA_TRANSFORM_FORMAT_HPP

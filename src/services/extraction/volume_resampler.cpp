#include "services/extraction/volume_resampler.hpp"

#include <cmath>

#include <itkBSplineInterpolateImageFunction.h>
#include <itkIdentityTransform.h>
#include <itkLinearInterpolateImageFunction.h>
#include <itkNearestNeighborInterpolateImageFunction.h>
#include <itkResampleImageFilter.h>

namespace dicom_extractor::services {

namespace {

/**
 * @brief Output size that covers the input extent at the target spacing
 */
template <typename TImage>
typename TImage::SizeType calculateOutputSize(
    const TImage* input,
    const std::array<double, 3>& targetSpacing
) {
    auto inputSize = input->GetLargestPossibleRegion().GetSize();
    auto inputSpacing = input->GetSpacing();

    typename TImage::SizeType outputSize;
    for (unsigned int i = 0; i < 3; ++i) {
        outputSize[i] = static_cast<typename TImage::SizeType::SizeValueType>(
            std::ceil(inputSize[i] * inputSpacing[i] / targetSpacing[i] - 1e-6)
        );
        if (outputSize[i] < 1) {
            outputSize[i] = 1;
        }
    }
    return outputSize;
}

template <typename TImage>
std::expected<typename TImage::Pointer, ResampleError> resampleNearest(
    typename TImage::Pointer input,
    const std::array<double, 3>& targetSpacing
) {
    try {
        using TransformType = itk::IdentityTransform<double, 3>;
        using InterpolatorType =
            itk::NearestNeighborInterpolateImageFunction<TImage, double>;
        using ResampleFilterType = itk::ResampleImageFilter<TImage, TImage>;

        typename TImage::SpacingType outputSpacing;
        for (unsigned int i = 0; i < 3; ++i) {
            outputSpacing[i] = targetSpacing[i];
        }

        auto resampleFilter = ResampleFilterType::New();
        resampleFilter->SetInput(input);
        resampleFilter->SetSize(calculateOutputSize<TImage>(input.GetPointer(), targetSpacing));
        resampleFilter->SetOutputSpacing(outputSpacing);
        resampleFilter->SetOutputOrigin(input->GetOrigin());
        resampleFilter->SetOutputDirection(input->GetDirection());
        resampleFilter->SetTransform(TransformType::New());
        resampleFilter->SetInterpolator(InterpolatorType::New());
        resampleFilter->SetDefaultPixelValue(0);  // Background label
        resampleFilter->Update();

        typename TImage::Pointer output = resampleFilter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ResampleError{
            ResampleError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

/**
 * @brief Nearest neighbour resampling onto the grid of @p reference
 *
 * Voxels outside the input extent become background (0).
 */
template <typename TImage>
std::expected<typename TImage::Pointer, ResampleError> resampleNearestOnto(
    typename TImage::Pointer input,
    const core::VolumeType* reference
) {
    try {
        using TransformType = itk::IdentityTransform<double, 3>;
        using InterpolatorType =
            itk::NearestNeighborInterpolateImageFunction<TImage, double>;
        using ResampleFilterType = itk::ResampleImageFilter<TImage, TImage>;

        auto resampleFilter = ResampleFilterType::New();
        resampleFilter->SetInput(input);
        resampleFilter->SetSize(reference->GetLargestPossibleRegion().GetSize());
        resampleFilter->SetOutputSpacing(reference->GetSpacing());
        resampleFilter->SetOutputOrigin(reference->GetOrigin());
        resampleFilter->SetOutputDirection(reference->GetDirection());
        resampleFilter->SetTransform(TransformType::New());
        resampleFilter->SetInterpolator(InterpolatorType::New());
        resampleFilter->SetDefaultPixelValue(0);
        resampleFilter->Update();

        typename TImage::Pointer output = resampleFilter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ResampleError{
            ResampleError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

}  // anonymous namespace

std::expected<VolumeResampler::ImageType::Pointer, ResampleError>
VolumeResampler::resample(ImageType::Pointer input, const Parameters& params)
{
    if (!input) {
        return std::unexpected(ResampleError{
            ResampleError::Code::InvalidInput,
            "Input image is null"
        });
    }

    if (!params.isValid()) {
        return std::unexpected(ResampleError{
            ResampleError::Code::InvalidParameters,
            "target spacing must be positive"
        });
    }

    try {
        using TransformType = itk::IdentityTransform<double, 3>;
        using ResampleFilterType = itk::ResampleImageFilter<ImageType, ImageType>;

        ImageType::SpacingType outputSpacing;
        for (unsigned int i = 0; i < 3; ++i) {
            outputSpacing[i] = params.targetSpacing[i];
        }

        auto resampleFilter = ResampleFilterType::New();
        resampleFilter->SetInput(input);
        resampleFilter->SetSize(calculateOutputSize<ImageType>(input.GetPointer(), params.targetSpacing));
        resampleFilter->SetOutputSpacing(outputSpacing);
        resampleFilter->SetOutputOrigin(input->GetOrigin());
        resampleFilter->SetOutputDirection(input->GetDirection());
        resampleFilter->SetTransform(TransformType::New());
        resampleFilter->SetDefaultPixelValue(0);

        switch (params.interpolation) {
            case Interpolation::NearestNeighbor: {
                using InterpolatorType =
                    itk::NearestNeighborInterpolateImageFunction<ImageType, double>;
                resampleFilter->SetInterpolator(InterpolatorType::New());
                break;
            }
            case Interpolation::Linear: {
                using InterpolatorType =
                    itk::LinearInterpolateImageFunction<ImageType, double>;
                resampleFilter->SetInterpolator(InterpolatorType::New());
                break;
            }
            case Interpolation::BSpline: {
                using InterpolatorType =
                    itk::BSplineInterpolateImageFunction<ImageType, double>;
                resampleFilter->SetInterpolator(InterpolatorType::New());
                break;
            }
        }

        resampleFilter->Update();

        ImageType::Pointer output = resampleFilter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ResampleError{
            ResampleError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

std::expected<VolumeResampler::MaskType::Pointer, ResampleError>
VolumeResampler::resampleMask(MaskType::Pointer input,
                              const std::array<double, 3>& targetSpacing)
{
    if (!input) {
        return std::unexpected(ResampleError{
            ResampleError::Code::InvalidInput,
            "Input mask is null"
        });
    }
    for (double s : targetSpacing) {
        if (!(s > 0.0)) {
            return std::unexpected(ResampleError{
                ResampleError::Code::InvalidParameters,
                "target spacing must be positive"
            });
        }
    }
    return resampleNearest<MaskType>(input, targetSpacing);
}

std::expected<VolumeResampler::LabelVolumeType::Pointer, ResampleError>
VolumeResampler::resampleLabelsOnto(LabelVolumeType::Pointer labels,
                                    const ImageType* reference)
{
    if (!labels || reference == nullptr) {
        return std::unexpected(ResampleError{
            ResampleError::Code::InvalidInput,
            "Label volume or reference is null"
        });
    }
    return resampleNearestOnto<LabelVolumeType>(labels, reference);
}

std::expected<VolumeResampler::MaskType::Pointer, ResampleError>
VolumeResampler::resampleMaskOnto(MaskType::Pointer mask, const ImageType* reference)
{
    if (!mask || reference == nullptr) {
        return std::unexpected(ResampleError{
            ResampleError::Code::InvalidInput,
            "Mask or reference is null"
        });
    }
    return resampleNearestOnto<MaskType>(mask, reference);
}

bool VolumeResampler::sameGrid(const itk::ImageBase<3>* a, const itk::ImageBase<3>* b)
{
    if (a == nullptr || b == nullptr) {
        return false;
    }
    if (a->GetLargestPossibleRegion().GetSize() != b->GetLargestPossibleRegion().GetSize()) {
        return false;
    }

    constexpr double kTolerance = 1e-4;
    for (unsigned int i = 0; i < 3; ++i) {
        if (std::abs(a->GetSpacing()[i] - b->GetSpacing()[i]) > kTolerance
            || std::abs(a->GetOrigin()[i] - b->GetOrigin()[i]) > kTolerance) {
            return false;
        }
        for (unsigned int j = 0; j < 3; ++j) {
            if (std::abs(a->GetDirection()[i][j] - b->GetDirection()[i][j]) > kTolerance) {
                return false;
            }
        }
    }
    return true;
}

std::string VolumeResampler::interpolationToString(Interpolation interp)
{
    switch (interp) {
        case Interpolation::NearestNeighbor:
            return "nearest";
        case Interpolation::Linear:
            return "linear";
        case Interpolation::BSpline:
            return "bspline";
    }
    return "unknown";
}

std::optional<VolumeResampler::Interpolation>
VolumeResampler::interpolationFromString(std::string_view name)
{
    if (name == "nearest") return Interpolation::NearestNeighbor;
    if (name == "linear") return Interpolation::Linear;
    if (name == "bspline") return Interpolation::BSpline;
    return std::nullopt;
}

}  // namespace dicom_extractor::services

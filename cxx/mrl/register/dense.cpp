#include "dense.hpp"

#include "../log/debug.hpp"
#include "../log/log.hpp"

#include <itkCommand.h>
#include <itkDemonsRegistrationFilter.h>
#include <itkHistogramMatchingImageFilter.h>
#include <itkImageRegionConstIteratorWithIndex.h>
#include <itkImportImageFilter.h>

namespace mrl {
namespace Dense {

namespace {
using DemonsType = itk::DemonsRegistrationFilter<ImageType, ImageType, FieldType>;

class Observer : public itk::Command
{
private:
  itk::WeakPointer<DemonsType> filter_;

protected:
  Observer(){};

public:
  using Self = Observer;
  using Superclass = itk::Command;
  using Pointer = itk::SmartPointer<Self>;

  itkOverrideGetNameOfClassMacro(Self);
  itkNewMacro(Self);
  void SetFilter(DemonsType *filter)
  {
    filter_ = filter;
    filter_->AddObserver(itk::IterationEvent(), this);
  }
  void Execute(itk::Object *caller, const itk::EventObject &event) override { Execute((const itk::Object *)caller, event); }
  void Execute(const itk::Object *, const itk::EventObject &event) override
  {
    if (typeid(event) == typeid(itk::IterationEvent)) {
      Log::Debug("Dense", "{:02d} metric {:5.3e} RMS change {:5.3e}", filter_->GetElapsedIterations(), filter_->GetMetric(),
                 filter_->GetRMSChange());
    }
  }
};
} // namespace

auto Import(Re3Map const data) -> ImageType::Pointer
{
  using TImport = itk::ImportImageFilter<float, 3>;

  TImport::IndexType st;
  st.Fill(0);
  TImport::SizeType sz;
  std::copy_n(data.dimensions().begin(), 3, sz.begin());
  TImport::RegionType region;
  region.SetIndex(st);
  region.SetSize(sz);

  TImport::SpacingType s;
  s.Fill(1.);
  TImport::OriginType o;
  o.Fill(0.);

  auto import = TImport::New();
  import->SetRegion(region);
  import->SetSpacing(s);
  import->SetOrigin(o);
  import->SetImportPointer(data.data(), data.size(), false);
  import->Update();
  return import->GetOutput();
}

auto Estimate(Re3 fixedData, Re3 movingData, Opts const &opts) -> Re4
{
  Sz3 const shape = fixedData.dimensions();
  if (shape != movingData.dimensions()) {
    throw Log::Failure("Dense", "Fixed shape {} does not match moving shape {}", shape, movingData.dimensions());
  }
  Log::Print("Dense", "Demons on {} iterations {} σ {}", shape, opts.its, opts.σ);
  auto const t0 = Log::Now();
  auto const fixed = Import(Re3Map(fixedData.data(), shape));
  auto       moving = Import(Re3Map(movingData.data(), shape));

  FieldType::Pointer field;
  try {
    if (opts.histograms) {
      using MatchType = itk::HistogramMatchingImageFilter<ImageType, ImageType>;
      auto matcher = MatchType::New();
      matcher->SetInput(moving);
      matcher->SetReferenceImage(fixed);
      matcher->SetNumberOfHistogramLevels(opts.levels);
      matcher->SetNumberOfMatchPoints(opts.matchPoints);
      matcher->ThresholdAtMeanIntensityOn();
      matcher->Update();
      moving = matcher->GetOutput();
    }

    auto demons = DemonsType::New();
    auto observer = Observer::New();
    observer->SetFilter(demons);
    demons->SetFixedImage(fixed);
    demons->SetMovingImage(moving);
    demons->SetNumberOfIterations(opts.its);
    demons->SetStandardDeviations(opts.σ);
    demons->Update();
    field = demons->GetOutput();
  } catch (itk::ExceptionObject const &err) {
    throw Log::Failure("Dense", "Demons registration failed: {}", err.what());
  }

  Re4 d(AddBack(shape, 3));
  itk::ImageRegionConstIteratorWithIndex<FieldType> it(field, field->GetLargestPossibleRegion());
  for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
    auto const ind = it.GetIndex();
    auto const v = it.Get();
    for (Index ic = 0; ic < 3; ic++) {
      d(ind[0], ind[1], ind[2], ic) = v[ic];
    }
  }
  Log::Print("Dense", "Finished in {}", Log::ToNow(t0));
  Log::Tensor<4>("dense-field", d, HD5::Dims::Field);
  return d;
}

} // namespace Dense
} // namespace mrl

/*
 * Ties a layout, a pattern, the correction stage and a driver into a
 * pipeline that renders one frame per tick.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

#include <new>
#include <type_traits>

#include "shimmer/protocol.h"
#include "color.h"
#include "config.h"
#include "debug.h"
#include "errors.h"
#include "layout.h"
#include "led_driver.h"
#include "patterns.h"
#include "render.h"

namespace shimmer {

namespace detail {

inline void reportBuildError(Error error) {
    debug::print("Can't build pipeline: ");
    debug::print(errorName(error));
    debug::print("\r\n");
}

} // namespace detail

// Counters kept by a running pipeline.
struct PipelineStats {
    uint32_t frames = 0;
    uint32_t transmissionErrors = 0;
};

// A built pipeline. Subclasses are template specialized for each pattern
// and driver combination, trading increased code size for a reduction in
// the number of branches per pixel.
class Pipeline {
public:
    virtual ~Pipeline() {}

    // Renders and transmits one frame for |timeMs| milliseconds since
    // start. Returns Error::transmission if the transport rejected the frame,
    // in which case the frame is dropped and the next tick starts fresh.
    [[nodiscard]] virtual Error tick(uint64_t timeMs) = 0;

    // Takes effect on the next tick.
    virtual void setBrightness(float brightness) = 0;
    virtual float brightness() const = 0;

    // Replaces the white point. Takes effect on the next tick.
    virtual void setColorCorrection(const render::ColorCorrection& whitepoint) = 0;
    virtual const render::ColorCorrection& colorCorrection() const = 0;

    virtual size_t pixelCount() const = 0;
    virtual const PipelineStats& stats() const = 0;

    // Output colors of the most recent tick.
    virtual const Rgb8* frame() const = 0;
};

template <size_t Dims, size_t Capacity, typename PatternT, typename DriverT>
class Control final : public Pipeline {
    static_assert(PatternT::dimensions == Dims, "Pattern dimensionality must match the layout.");
    static_assert(DriverT::capacity == Capacity, "Driver buffers must be sized for the layout.");

public:
    using Layout = shimmer::Layout<Dims, Capacity>;
    using Shape = shimmer::Shape<Dims>;
    using Pattern = PatternT;
    using Driver = DriverT;

private:
    Layout layout_;
    Pattern pattern_;
    Driver driver_;
    render::Corrector<Capacity> corrector_;
    PipelineStats stats_;
    bool failing_ = false;
    Rgb working_[Capacity];
    Rgb8 output_[Capacity] = {};

public:
    // All arguments must have passed validation, see ControlBuilder::build().
    Control(const Shape* shapes, size_t shapeCount,
            const typename Pattern::Params& patternParams,
            const typename Driver::Options& driverOptions,
            const render::CorrectionOptions& correction) :
            pattern_(patternParams),
            driver_(driverOptions),
            corrector_(correction) {
        layout_.assign(shapes, shapeCount);
    }

    Error tick(uint64_t timeMs) override {
        const size_t count = layout_.size();

        pattern_.advance(timeMs);
        for (size_t i = 0; i < count; ++i) {
            working_[i] = pattern_.evaluate(layout_[i], timeMs);
        }
        corrector_.apply(working_, output_, count);

        stats_.frames++;
        Error error = driver_.write(output_);
        if (error != Error::none) {
            stats_.transmissionErrors++;

            // Once per run of failures, the counters keep the rest.
            if (!failing_) {
                debug::print("Frame ");
                debug::printUnsigned(stats_.frames);
                debug::print(" dropped: ");
                debug::print(errorName(error));
                debug::print("\r\n");
            }
        }
        failing_ = error != Error::none;
        return error;
    }

    void setBrightness(float brightness) override { corrector_.setBrightness(brightness); }
    float brightness() const override { return corrector_.brightness(); }
    void setColorCorrection(const render::ColorCorrection& whitepoint) override {
        corrector_.setColorCorrection(whitepoint);
    }
    const render::ColorCorrection& colorCorrection() const override { return corrector_.colorCorrection(); }
    size_t pixelCount() const override { return layout_.size(); }
    const PipelineStats& stats() const override { return stats_; }
    const Rgb8* frame() const override { return output_; }

    const Layout& layout() const { return layout_; }
    Pattern& pattern() { return pattern_; }
    const Pattern& pattern() const { return pattern_; }
    const Driver& driver() const { return driver_; }
};

namespace detail {

// Parameter types of a builder's pattern and driver, or placeholders until
// they are chosen.
struct Unset {};

template <typename T> struct ParamsOf { using Type = typename T::Params; };
template <> struct ParamsOf<void> { using Type = Unset; };

template <typename T> struct OptionsOf { using Type = typename T::Options; };
template <> struct OptionsOf<void> { using Type = Unset; };

} // namespace detail

// Memory suitable for building a pipeline of type |ControlT| in place.
template <typename ControlT>
using ControlStorage = std::aligned_union_t<0, ControlT>;

// Collects the pieces of a pipeline and builds it in caller-provided memory.
//
// Pattern and driver are chosen by type, so a builder missing either one,
// or pairing a pattern with a layout of different dimensionality, fails to
// compile rather than failing at runtime. Everything that depends on
// runtime values is checked once by build().
template <size_t Dims, size_t Capacity, typename PatternT = void, typename DriverT = void>
class ControlBuilder {
    template <size_t, size_t, typename, typename> friend class ControlBuilder;

public:
    using Shape = shimmer::Shape<Dims>;
    using PatternParams = typename detail::ParamsOf<PatternT>::Type;
    using DriverOptions = typename detail::OptionsOf<DriverT>::Type;
    using ControlType = Control<Dims, Capacity, PatternT, DriverT>;

private:
    const Shape* shapes_ = nullptr;
    size_t shapeCount_ = 0;
    PatternParams patternParams_{};
    DriverOptions driverOptions_{};
    render::CorrectionOptions correction_;

    template <typename P, typename D>
    ControlBuilder<Dims, Capacity, P, D> rebind(const typename detail::ParamsOf<P>::Type& patternParams,
            const typename detail::OptionsOf<D>::Type& driverOptions) const {
        ControlBuilder<Dims, Capacity, P, D> next;
        next.shapes_ = shapes_;
        next.shapeCount_ = shapeCount_;
        next.patternParams_ = patternParams;
        next.driverOptions_ = driverOptions;
        next.correction_ = correction_;
        return next;
    }

public:
    // |shapes| must outlive build().
    ControlBuilder withLayout(const Shape* shapes, size_t shapeCount) const {
        ControlBuilder next = *this;
        next.shapes_ = shapes;
        next.shapeCount_ = shapeCount;
        return next;
    }

    template <size_t K>
    ControlBuilder withLayout(const Shape (&shapes)[K]) const {
        return withLayout(shapes, K);
    }

    template <typename P>
    ControlBuilder<Dims, Capacity, P, DriverT> withPattern(const typename P::Params& params) const {
        static_assert(P::dimensions == Dims, "Pattern dimensionality must match the layout.");
        return rebind<P, DriverT>(params, driverOptions_);
    }

    template <typename D>
    ControlBuilder<Dims, Capacity, PatternT, D> withDriver(const typename D::Options& options) const {
        return rebind<PatternT, D>(patternParams_, options);
    }

    ControlBuilder withBrightness(float brightness) const {
        ControlBuilder next = *this;
        next.correction_.brightness = brightness;
        return next;
    }

    ControlBuilder withGamma(float gamma) const {
        ControlBuilder next = *this;
        next.correction_.gamma = gamma;
        return next;
    }

    ControlBuilder withColorCorrection(const render::ColorCorrection& whitepoint) const {
        ControlBuilder next = *this;
        next.correction_.whitepoint = whitepoint;
        return next;
    }

    ControlBuilder withDither(protocol::DitherMode mode) const {
        ControlBuilder next = *this;
        next.correction_.ditherMode = mode;
        return next;
    }

    ControlBuilder withCorrection(const render::CorrectionOptions& correction) const {
        ControlBuilder next = *this;
        next.correction_ = correction;
        return next;
    }

    // Checks everything build() would check without building.
    [[nodiscard]] Error validate() const {
        static_assert(!std::is_void<PatternT>::value, "A pattern is required, call withPattern().");
        static_assert(!std::is_void<DriverT>::value, "A driver is required, call withDriver().");

        Error error = DriverT::validate(driverOptions_);
        if (error != Error::none) return error;
        error = ControlType::Layout::validate(shapes_, shapeCount_, driverOptions_.pixelCount);
        if (error != Error::none) return error;
        return render::validate(correction_);
    }

    // Constructs the pipeline in |mem|, which must be a ControlStorage<ControlType>.
    // Returns nullptr and sets |error| if the configuration is invalid.
    ControlType* build(void* mem, Error* error) const {
        Error result = validate();
        if (error != nullptr) *error = result;
        if (result != Error::none) {
            detail::reportBuildError(result);
            return nullptr;
        }
        return new (mem) ControlType(shapes_, shapeCount_, patternParams_, driverOptions_, correction_);
    }

    const render::CorrectionOptions& correction() const { return correction_; }
};

/*** Pipelines selected at runtime ***/

// Identifies a pipeline compiled into the table.
struct PipelineId {
    size_t dimensions;
    protocol::PatternType pattern;
    protocol::NoiseAlgorithm algorithm;  // ignored for rainbows
    protocol::Chipset chipset;
};

// Everything a runtime-selected pipeline may need. Only the shapes matching
// the chosen dimensionality and the options of the chosen driver are used.
struct PipelineOptions {
    const Shape<1>* shapes1 = nullptr;
    const Shape<2>* shapes2 = nullptr;
    const Shape<3>* shapes3 = nullptr;
    size_t shapeCount = 0;

    RainbowParams rainbow;
    NoiseParams noise;

    led::ClockedOptions clocked;
    led::ClocklessOptions clockless;

    render::CorrectionOptions correction;

    // Set by loaders that could not resolve every layout entry. The build
    // fails with it rather than running on a partial layout.
    Error layoutError = Error::none;
};

namespace detail {

template <size_t Dims> const Shape<Dims>* shapesFor(const PipelineOptions& options);
template <> inline const Shape<1>* shapesFor<1>(const PipelineOptions& options) { return options.shapes1; }
template <> inline const Shape<2>* shapesFor<2>(const PipelineOptions& options) { return options.shapes2; }
template <> inline const Shape<3>* shapesFor<3>(const PipelineOptions& options) { return options.shapes3; }

inline const RainbowParams& paramsFor(const PipelineOptions& options, const RainbowParams*) { return options.rainbow; }
inline const NoiseParams& paramsFor(const PipelineOptions& options, const NoiseParams*) { return options.noise; }

inline const led::ClockedOptions& optionsFor(const PipelineOptions& options, const led::ClockedOptions*) {
    return options.clocked;
}
inline const led::ClocklessOptions& optionsFor(const PipelineOptions& options, const led::ClocklessOptions*) {
    return options.clockless;
}

template <typename PatternT>
constexpr bool patternMatches(const PipelineId& id) {
    if (id.pattern != PatternT::type) return false;
    if constexpr (PatternT::type == protocol::PatternType::noise) {
        return id.algorithm == PatternT::algorithm;
    } else {
        return true;
    }
}

} // namespace detail

// Tag to select a particular pipeline to be compiled.
template <size_t Dims, typename PatternT, typename DriverT>
struct PipelineTag {
    using Type = Control<Dims, config::maxPixels, PatternT, DriverT>;

    static bool matches(const PipelineId& id) {
        return id.dimensions == Dims && detail::patternMatches<PatternT>(id) && DriverT::supports(id.chipset);
    }

    static Pipeline* make(void* mem, const PipelineOptions& options, Error* error) {
        return ControlBuilder<Dims, config::maxPixels>()
                .withLayout(detail::shapesFor<Dims>(options), options.shapeCount)
                .template withPattern<PatternT>(detail::paramsFor(options,
                        static_cast<const typename PatternT::Params*>(nullptr)))
                .template withDriver<DriverT>(detail::optionsFor(options,
                        static_cast<const typename DriverT::Options*>(nullptr)))
                .withCorrection(options.correction)
                .build(mem, error);
    }
};

// Holds a pipeline that is chosen and configured at runtime.
class PipelineHolder {
    template <typename ...Tags>
    struct PipelineTable {
        static constexpr size_t count = sizeof...(Tags);
        typedef bool (*Matcher)(const PipelineId& id);
        static constexpr Matcher matchers[] = { Tags::matches... };
        typedef Pipeline* (*Factory)(void* mem, const PipelineOptions& options, Error* error);
        static constexpr Factory factories[] = { Tags::make... };
        using Storage = std::aligned_union_t<0, typename Tags::Type...>;
    };
    using Pipelines = PipelineTable<SHIMMER_CONFIG_PIPELINES>;

    Pipeline* pipeline_ = nullptr;
    Pipelines::Storage pipelineStorage_;

public:
    PipelineHolder() {}
    ~PipelineHolder() { clear(); }

    PipelineHolder(const PipelineHolder&) = delete;
    PipelineHolder& operator=(const PipelineHolder&) = delete;

    // Gets the current pipeline, or nullptr if initialization hasn't
    // happened yet or failed.
    inline Pipeline* get() const { return pipeline_; }

    // Builds the pipeline identified by |id|.
    //
    // Returns Error::unknownPipeline if that combination hasn't been compiled
    // in, or the build error of the pipeline otherwise. Failures are also
    // reported through the debug sink.
    [[nodiscard]] Error init(const PipelineId& id, const PipelineOptions& options) {
        clear();

        if (options.layoutError != Error::none) {
            detail::reportBuildError(options.layoutError);
            return options.layoutError;
        }

        for (size_t i = 0; i < Pipelines::count; i++) {
            if ((Pipelines::matchers[i])(id)) {
                Error error = Error::none;
                pipeline_ = (Pipelines::factories[i])(&pipelineStorage_, options, &error);
                return error;
            }
        }
        detail::reportBuildError(Error::unknownPipeline);
        return Error::unknownPipeline;
    }

    void clear() {
        if (pipeline_ != nullptr) {
            pipeline_->~Pipeline();
            pipeline_ = nullptr;
        }
    }

    static constexpr size_t compiledPipelines() { return Pipelines::count; }
};

// Prints the compile-time limits and a pipeline's configuration.
inline void dumpBuildOptions(const PipelineId& id, const render::CorrectionOptions& correction) {
    debug::print("Shimmer pipeline\r\n");
    debug::dumpUnsigned("max pixels", config::maxPixels);
    debug::dumpUnsigned("max shapes", config::maxShapes);
    debug::dumpUnsigned("dimensions", id.dimensions);
    debug::dumpString("pattern", id.pattern == protocol::PatternType::rainbow ? "rainbow" :
            id.algorithm == protocol::NoiseAlgorithm::perlin ? "perlin noise" :
            id.algorithm == protocol::NoiseAlgorithm::simplex ? "simplex noise" : "opensimplex noise");
    for (const auto& elem : protocol::namedChipsets) {
        if (elem.chipset == id.chipset) debug::dumpString("chipset", elem.name);
    }
    debug::dumpFloat("brightness", correction.brightness);
    debug::dumpFloat("gamma", correction.gamma);
    debug::dumpString("dither", correction.ditherMode == protocol::DitherMode::temporal ? "temporal" : "none");
}

// Prints a running pipeline's counters.
inline void dumpStats(const Pipeline& pipeline) {
    debug::dumpUnsigned("frames", pipeline.stats().frames);
    debug::dumpUnsigned("transmission errors", pipeline.stats().transmissionErrors);
    debug::dumpUnsigned("pixels", pipeline.pixelCount());
}

} // namespace shimmer

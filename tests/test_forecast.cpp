/**
 * Unit tests for the ensemble forecast
 */

#include "test_framework.hpp"
#include "openetas/forecast/forecast.hpp"
#include <stdexcept>

using namespace openetas;
using namespace openetas::test;

namespace {

Parameters forecastParameters() {
    Parameters p;
    p.mu = 1e-4;
    p.k0 = 0.1;
    p.alpha = 0.8;
    p.c = 0.01;
    p.p = 1.2;
    p.d = 1.0;
    p.gamma = 0.5;
    p.q = 1.5;
    return p;
}

// One year of uniform seismicity ending with a M6.5 just before the forecast
Catalog observedCatalog() {
    Rng rng(3);
    std::uniform_real_distribution<double> ux(0.0, 100.0);
    std::uniform_real_distribution<double> ut(0.0, 360.0);
    GutenbergRichter gr = GutenbergRichter::fromBValue(1.0, 3.0);

    std::vector<Event> events;
    for (int i = 0; i < 40; i++) {
        events.push_back(Event(ut(rng), ux(rng), ux(rng), 10.0, gr.sample(rng)));
    }
    events.push_back(Event(364.9, 50.0, 50.0, 10.0, 6.5));
    return Catalog(events, Region::rectangle(0, 100, 0, 100), TimeWindow(0.0, 365.0), 3.0);
}

ForecastOptions smallEnsemble() {
    ForecastOptions options;
    options.n_simulations = 24;
    options.forecast_days = 10.0;
    options.m_threshold = 4.0;
    options.grid_nx = 10;
    options.grid_ny = 10;
    options.n_threads = 2;
    options.simulation.seed = 99;
    return options;
}

} // anonymous namespace

TEST(Forecast, RealizationStreams) {
    Rng a = ForecastEngine::realizationStream(42, 0);
    Rng b = ForecastEngine::realizationStream(42, 0);
    Rng c = ForecastEngine::realizationStream(42, 1);
    Rng d = ForecastEngine::realizationStream(43, 0);

    uint64_t va = a();
    ASSERT_EQ(va, b());
    ASSERT_NE(va, c());
    ASSERT_NE(va, d());
}

TEST(Forecast, Quantile) {
    std::vector<double> sorted = {1, 2, 3, 4, 5};
    ASSERT_NEAR(ForecastEngine::quantile(sorted, 0.5), 3.0, 1e-12);
    ASSERT_NEAR(ForecastEngine::quantile(sorted, 0.25), 2.0, 1e-12);
    ASSERT_NEAR(ForecastEngine::quantile(sorted, 0.05), 1.2, 1e-12);
    ASSERT_NEAR(ForecastEngine::quantile(sorted, 1.0), 5.0, 1e-12);
    ASSERT_NEAR(ForecastEngine::quantile(std::vector<double>{7.0}, 0.9), 7.0, 1e-12);
    ASSERT_NEAR(ForecastEngine::quantile(std::vector<double>(), 0.5), 0.0, 1e-12);
}

TEST(Forecast, EnsembleStatistics) {
    Catalog catalog = observedCatalog();
    ForecastOptions options = smallEnsemble();
    options.keep_catalogs = true;
    ForecastEngine engine(options);

    ForecastResult result = engine.run(catalog, forecastParameters());
    const EnsembleResult& ens = result.ensemble;

    ASSERT_FALSE(result.inverted);
    ASSERT_EQ(ens.realizations.size(), 24u);
    ASSERT_EQ(ens.n_failed, 0u);
    ASSERT_EQ(ens.succeeded(), 24u);
    ASSERT_NEAR(ens.window.start, 365.0, 1e-12);
    ASSERT_NEAR(ens.window.end, 375.0, 1e-12);

    ASSERT_LE(ens.quantile_05, ens.quantile_50);
    ASSERT_LE(ens.quantile_50, ens.quantile_95);
    ASSERT_GT(ens.mean_count, 0.0);
    ASSERT_GE(ens.probability_above_threshold, 0.0);
    ASSERT_LE(ens.probability_above_threshold, 1.0);

    // Every emitted event lands in one cell
    ASSERT_EQ(ens.rate_map.size(), 100u);
    double mapped = 0;
    for (double v : ens.rate_map) mapped += v;
    ASSERT_REL_NEAR(mapped, ens.mean_count, 1e-9);

    ASSERT_EQ(ens.catalogs.size(), 24u);
    for (size_t r = 0; r < ens.catalogs.size(); r++) {
        ASSERT_EQ(ens.catalogs[r].size(), ens.realizations[r].n_events);
        for (const Event& e : ens.catalogs[r].events()) {
            ASSERT_GE(e.time, 365.0);
            ASSERT_LE(e.time, 375.0);
        }
    }
    ASSERT_FALSE(ens.summary().empty());
}

TEST(Forecast, AftershocksRaiseTheForecast) {
    Catalog catalog = observedCatalog();
    ForecastEngine engine(smallEnsemble());

    ForecastOptions fresh_options = smallEnsemble();
    fresh_options.mode = SimulationMode::FreshStart;
    fresh_options.burn_in_days = 0.0;
    ForecastEngine fresh(fresh_options);

    double with_history = engine.run(catalog, forecastParameters()).ensemble.mean_count;
    double without = fresh.run(catalog, forecastParameters()).ensemble.mean_count;
    // The M6.5 just before the window has kappa = 0.1 * 10^2.8
    ASSERT_GT(with_history, without);
}

TEST(Forecast, MainshockAtWindowEndSeedsTheForecast) {
    // Catalog window closes on the mainshock itself
    std::vector<Event> events = observedCatalog().events();
    events.back().time = 365.0;
    Catalog catalog(events, Region::rectangle(0, 100, 0, 100), TimeWindow(0.0, 365.0), 3.0);

    EnsembleResult ens = ForecastEngine(smallEnsemble()).run(catalog, forecastParameters()).ensemble;
    ASSERT_EQ(ens.n_failed, 0u);
    // About 10 background events; the M6.5 adds kappa = 0.1 * 10^2.8 direct
    // offspring, three quarters of them inside 10 days
    ASSERT_GT(ens.mean_count, 30.0);
}

TEST(Forecast, InvalidSuppliedParametersThrow) {
    Catalog catalog = observedCatalog();
    Parameters bad = forecastParameters();
    bad.p = 0.9;

    ForecastEngine engine(smallEnsemble());
    ASSERT_THROW(engine.run(catalog, bad), std::invalid_argument);
}

TEST(Forecast, IndependentOfThreadCount) {
    Catalog catalog = observedCatalog();

    ForecastOptions one = smallEnsemble();
    one.n_threads = 1;
    ForecastOptions four = smallEnsemble();
    four.n_threads = 4;

    EnsembleResult a = ForecastEngine(one).run(catalog, forecastParameters()).ensemble;
    EnsembleResult b = ForecastEngine(four).run(catalog, forecastParameters()).ensemble;

    ASSERT_EQ(a.realizations.size(), b.realizations.size());
    for (size_t r = 0; r < a.realizations.size(); r++) {
        ASSERT_EQ(a.realizations[r].n_events, b.realizations[r].n_events);
        ASSERT_EQ(a.realizations[r].max_magnitude, b.realizations[r].max_magnitude);
    }
    ASSERT_EQ(a.mean_count, b.mean_count);
}

TEST(Forecast, OverflowingRealizationsAreRecorded) {
    Catalog catalog = observedCatalog();
    ForecastOptions options = smallEnsemble();
    options.simulation.max_events = 3;

    Parameters p = forecastParameters();
    p.mu = 1e-2;        // about a thousand background events per realisation

    ForecastEngine engine(options);
    ForecastResult result;
    ASSERT_NO_THROW(result = engine.run(catalog, p));

    const EnsembleResult& ens = result.ensemble;
    ASSERT_EQ(ens.n_failed, 24u);
    ASSERT_EQ(ens.succeeded(), 0u);
    for (const auto& r : ens.realizations) {
        ASSERT_TRUE(r.failed);
        ASSERT_FALSE(r.error.empty());
    }
    ASSERT_NEAR(ens.mean_count, 0.0, 1e-15);
    ASSERT_TRUE(ens.rate_map.empty());
}

TEST(Forecast, ThresholdProbability) {
    Catalog catalog = observedCatalog();
    ForecastOptions options = smallEnsemble();
    options.m_threshold = 3.0;      // any event counts

    EnsembleResult ens = ForecastEngine(options).run(catalog, forecastParameters()).ensemble;

    size_t non_empty = 0;
    for (const auto& r : ens.realizations) {
        if (r.n_events > 0) non_empty++;
        ASSERT_EQ(r.n_above_threshold, r.n_events);
    }
    ASSERT_NEAR(ens.probability_above_threshold,
                static_cast<double>(non_empty) / ens.realizations.size(), 1e-12);
}

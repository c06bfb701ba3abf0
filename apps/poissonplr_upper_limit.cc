#include "poissonplr/io/ConfigManager.hh"
#include "poissonplr/experiment/ExperimentSetup.hh"

#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/limits/LimitCalculator.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/stats/TestStatisticFactory.hh"

#include <TFile.h>
#include <TGraph.h>
#include <TNamed.h>
#include <TParameter.h>
#include <filesystem>
#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: poissonplr_upper_limit <config.json>\n";
        return 1;
    }

    try {
        using namespace poissonplr;

        io::ConfigManager cfg(argv[1]);
        cfg.parse();

        experiment::ExperimentSetup setup(cfg.experiment_cfg(), cfg.run().rng_seed);
        const auto summary = setup.prepare_summary();

        const stats::StatisticsConfig scfg = cfg.statistics();
        const auto stat = stats::MakeTestStatistic(scfg);
        const auto kind = stat->Kind();
        const double cl = scfg.cl;

        std::cout << "[poissonplr] Run: " << cfg.run().label << "\n"
                  << "  Mode: " << summary.mode_string << "\n"
                  << "  Test statistic: " << stat->Name() << "\n"
                  << "  CL: " << cl << "\n"
                  << "  Bins: " << summary.n_bins << "\n"
                  << "  Signal total (mu=1): " << summary.signal_total << "\n"
                  << "  Background total: " << summary.background_total << "\n";

        auto calc = std::make_shared<const stats::TestStatisticCalculator>(
            fit::FitEngine(cfg.fit()), scfg);
        limits::LimitCalculator lc(calc, cfg.limit());

        // -------------------- Limits --------------------
        const double mu_up = lc.Limit(setup.data(), cl, kind);
        const auto bands = lc.ExpectedLimitBands(setup.template_dataset(), cl, kind);

        std::cout << "\n[limit]\n"
                  << "  mu_up (" << summary.mode_string << "): " << mu_up << "\n"
                  << "  expected median : " << bands.median << "\n"
                  << "  expected -1/+1 sigma : " << bands.minus1 << " / " << bands.plus1 << "\n"
                  << "  expected -2/+2 sigma : " << bands.minus2 << " / " << bands.plus2 << "\n";

        // -------------------- q(mu) scan up to twice the limit --------------------
        const int npts = 40;
        const double scan_max = 2.0 * std::max(mu_up, bands.plus2);
        std::vector<double> mus;
        for (int i = 0; i <= npts; ++i) mus.push_back(scan_max * i / npts);
        const auto scan = lc.Scan(setup.data(), mus, kind);

        TGraph g(static_cast<int>(scan.size()));
        g.SetName("q_scan");
        g.SetTitle((stat->Name() + " scan; #mu; q").c_str());
        for (std::size_t i = 0; i < scan.size(); ++i)
            g.SetPoint(static_cast<int>(i), scan[i].first, scan[i].second);

        // -------------------- Write ROOT outputs --------------------
        std::filesystem::create_directories(cfg.run().outdir);
        std::string outpath = cfg.run().outdir + "/upper_limit.root";
        {
            TFile fout(outpath.c_str(), "RECREATE");
            TNamed("label", cfg.run().label.c_str()).Write();
            TNamed("mode", summary.mode_string.c_str()).Write();
            TNamed("test_stat", stat->Name().c_str()).Write();
            TParameter<double>("cl", cl).Write();
            TParameter<double>("mu_up", mu_up).Write();
            TParameter<double>("mu_up_expected", bands.median).Write();
            TParameter<double>("mu_up_minus1", bands.minus1).Write();
            TParameter<double>("mu_up_plus1", bands.plus1).Write();
            TParameter<double>("mu_up_minus2", bands.minus2).Write();
            TParameter<double>("mu_up_plus2", bands.plus2).Write();
            g.Write();
            fout.Close();
        }

        std::cout << "\n[output] results written to: " << outpath << "\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}

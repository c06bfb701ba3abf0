#include "poissonplr/io/ConfigManager.hh"
#include "poissonplr/io/DistributionIO.hh"
#include "poissonplr/experiment/ExperimentSetup.hh"

#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/limits/SignificanceCalculator.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/toys/ToySampler.hh"

#include <TFile.h>
#include <TNamed.h>
#include <TParameter.h>
#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: poissonplr_discovery <config.json>\n";
        return 1;
    }

    try {
        using namespace poissonplr;

        // -------------------- Load config & datasets --------------------
        io::ConfigManager cfg(argv[1]);
        cfg.parse();

        experiment::ExperimentSetup setup(cfg.experiment_cfg(), cfg.run().rng_seed);
        const auto summary = setup.prepare_summary();

        std::cout << "[poissonplr] Run: " << cfg.run().label << "\n"
                  << "  Mode: " << summary.mode_string << "\n"
                  << "  Bins: " << summary.n_bins << "\n"
                  << "  Signal total (mu=1): " << summary.signal_total << "\n"
                  << "  Background total: " << summary.background_total << "\n"
                  << "  Data total: " << summary.data_total << "\n";

        auto calc = std::make_shared<const stats::TestStatisticCalculator>(
            fit::FitEngine(cfg.fit()), cfg.statistics());
        limits::SignificanceCalculator sig(calc);

        // -------------------- Discovery test on the data --------------------
        auto work = setup.data().Clone();
        const auto r = calc->EvaluateDetailed(*work, 0.0, stats::TestStatisticKind::Q0);
        const double p_asym = sig.PValue(r.q, stats::TestStatisticKind::Q0, stats::AsymptoticParameters{0.0});
        const double z_asym = limits::SignificanceCalculator::Significance(p_asym);

        std::cout << "\n[discovery]\n"
                  << "  mu_hat : " << r.mu_hat << (r.floored ? " (floored)" : "") << "\n"
                  << "  q0     : " << r.q << "\n"
                  << "  p      : " << p_asym << "\n"
                  << "  Z      : " << z_asym << "\n";

        double z_expected = 0.0;
        if (cfg.run().true_mu > 0.0) {
            z_expected = sig.ExpectedDiscoverySignificance(setup.template_dataset(), cfg.run().true_mu);
            std::cout << "  Z expected (Asimov, mu=" << cfg.run().true_mu << "): " << z_expected << "\n";
        }

        // -------------------- Optional toy-based p-value --------------------
        toys::Distribution null_dist;
        double z_toys = 0.0;
        if (cfg.has_toys()) {
            toys::ToySampler sampler(calc, cfg.toys());
            null_dist = sampler.Sample(setup.template_dataset(), 0.0, 0.0, stats::TestStatisticKind::Q0,
                                       cfg.toys().n_toys, cfg.toys().base_seed);
            const double p_toys = limits::SignificanceCalculator::PValue(r.q, null_dist);
            z_toys = limits::SignificanceCalculator::Significance(p_toys);
            std::cout << "  p (toys, " << null_dist.size() << " samples): " << p_toys << "\n"
                      << "  Z (toys): " << z_toys << "\n";
        }

        // -------------------- Write ROOT outputs --------------------
        std::filesystem::create_directories(cfg.run().outdir);
        std::string outpath = cfg.run().outdir + "/discovery.root";
        {
            TFile fout(outpath.c_str(), "RECREATE");
            TNamed("label", cfg.run().label.c_str()).Write();
            TNamed("mode", summary.mode_string.c_str()).Write();
            TParameter<double>("q0", r.q).Write();
            TParameter<double>("mu_hat", r.mu_hat).Write();
            TParameter<double>("p_asymptotic", p_asym).Write();
            TParameter<double>("Z_asymptotic", z_asym).Write();
            if (cfg.run().true_mu > 0.0) TParameter<double>("Z_expected", z_expected).Write();
            if (cfg.has_toys()) {
                TParameter<double>("Z_toys", z_toys).Write();
                io::DistributionIO::Write(null_dist, fout, "q0_null");
            }
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

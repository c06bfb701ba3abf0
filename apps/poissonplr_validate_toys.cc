#include "poissonplr/io/ConfigManager.hh"
#include "poissonplr/io/DistributionIO.hh"
#include "poissonplr/experiment/ExperimentSetup.hh"

#include "poissonplr/fit/FitEngine.hh"
#include "poissonplr/limits/SignificanceCalculator.hh"
#include "poissonplr/stats/TestStatisticCalculator.hh"
#include "poissonplr/stats/TestStatisticFactory.hh"
#include "poissonplr/toys/ToySampler.hh"
#include "poissonplr/toys/ToyValidation.hh"

#include <TFile.h>
#include <TH1D.h>
#include <TParameter.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>

// Compares toy q distributions with the asymptotic formulae at
// hypothesis mu = toys.hypothesis_mu and true mu = run.true_mu.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: poissonplr_validate_toys <config.json>\n";
        return 1;
    }

    try {
        using namespace poissonplr;

        io::ConfigManager cfg(argv[1]);
        cfg.parse();
        if (!cfg.has_toys())
            throw std::invalid_argument("config has no \"toys\" block");

        experiment::ExperimentSetup setup(cfg.experiment_cfg(), cfg.run().rng_seed);

        const auto stat = stats::MakeTestStatistic(cfg.statistics());
        const auto kind = stat->Kind();
        const auto& tc = cfg.toys();
        const double mu_hyp = kind == stats::TestStatisticKind::Q0 ? 0.0 : tc.hypothesis_mu;
        const double mu_true = cfg.run().true_mu;

        std::cout << "[poissonplr] Run: " << cfg.run().label << "\n"
                  << "  Test statistic: " << stat->Name() << "\n"
                  << "  mu (hypothesis): " << mu_hyp << "\n"
                  << "  mu (true): " << mu_true << "\n"
                  << "  Toys: " << tc.n_toys << " (seed " << tc.base_seed << ")\n";

        auto calc = std::make_shared<const stats::TestStatisticCalculator>(
            fit::FitEngine(cfg.fit()), cfg.statistics());

        toys::ToySampler sampler(calc, tc);
        const auto dist = sampler.Sample(setup.template_dataset(), mu_true, mu_hyp, kind,
                                         tc.n_toys, tc.base_seed);

        stats::AsymptoticParameters ap;
        ap.mu = mu_hyp;
        ap.mu_true = mu_true;
        if ((kind == stats::TestStatisticKind::QTildeMu || mu_true != mu_hyp) &&
            (mu_hyp != 0.0 || mu_true != 0.0)) {
            limits::SignificanceCalculator sig(calc);
            ap.sigma = sig.Sigma(setup.template_dataset(), mu_hyp != 0.0 ? mu_hyp : mu_true);
        }

        const auto rep = toys::ValidateAgainstAsymptotics(dist, ap);

        std::cout << "\n[validation]\n"
                  << "  completed / failed : " << dist.NCompleted() << " / " << dist.NFailed() << "\n"
                  << "  KS distance        : " << rep.ks_distance << "\n"
                  << "  median (toys/asym) : " << rep.empirical_median << " / " << rep.asymptotic_median << "\n"
                  << "  q95 (toys/asym)    : " << rep.empirical_q95 << " / " << rep.asymptotic_q95 << "\n"
                  << "  P(q=0) (toys/asym) : " << rep.zero_fraction << " / " << rep.asymptotic_zero_fraction << "\n";

        // -------------------- Write ROOT outputs --------------------
        std::filesystem::create_directories(cfg.run().outdir);
        std::string outpath = cfg.run().outdir + "/toy_validation.root";
        {
            TFile fout(outpath.c_str(), "RECREATE");

            const double qmax = std::max(1.0, 1.2 * dist.Quantile(0.999));
            TH1D h("q_toys", (stat->Name() + "; q; toys").c_str(), 100, 0.0, qmax);
            for (double q : dist.Values()) h.Fill(q);
            h.Write();

            TParameter<double>("ks_distance", rep.ks_distance).Write();
            TParameter<double>("median_toys", rep.empirical_median).Write();
            TParameter<double>("median_asymptotic", rep.asymptotic_median).Write();
            TParameter<double>("q95_toys", rep.empirical_q95).Write();
            TParameter<double>("q95_asymptotic", rep.asymptotic_q95).Write();
            TParameter<double>("sigma", ap.sigma).Write();

            io::DistributionIO::Write(dist, fout, "distribution");
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

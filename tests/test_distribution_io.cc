#include <gtest/gtest.h>

#include <TFile.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "poissonplr/io/DistributionIO.hh"
#include "poissonplr/toys/Distribution.hh"

using namespace poissonplr;

namespace {

toys::Distribution MakeDistribution() {
  toys::Distribution d(stats::TestStatisticKind::QTildeMu, 2.0, 0.5);
  for (int i = 0; i < 25; ++i) {
    toys::TestStatisticSample s;
    s.q = 0.1 * i;
    s.mu_hypothesis = 2.0;
    s.mu_true = 0.5;
    s.mu_hat = 0.5 + 0.01 * i;
    s.seed = toys::DeriveToySeed(11, i);
    s.toy_index = i;
    d.Append(s);
  }
  d.SetBookkeeping(30, 25, 2, true);
  return d;
}

std::string TempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST(DistributionIO, WriteThenReadPreservesSamplesAndBookkeeping) {
  const auto path = TempPath("poissonplr_dist_io.root");
  std::remove(path.c_str());

  const auto in = MakeDistribution();
  io::DistributionIO::Write(in, path, "qtilde_mu2");

  const auto out = io::DistributionIO::Read(path, "qtilde_mu2");
  EXPECT_EQ(out.kind(), stats::TestStatisticKind::QTildeMu);
  EXPECT_DOUBLE_EQ(out.mu_hypothesis(), 2.0);
  EXPECT_DOUBLE_EQ(out.mu_true(), 0.5);
  EXPECT_EQ(out.NRequested(), 30);
  EXPECT_EQ(out.NCompleted(), 25);
  EXPECT_EQ(out.NFailed(), 2);
  EXPECT_TRUE(out.Cancelled());

  ASSERT_EQ(out.size(), in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    EXPECT_DOUBLE_EQ(out.samples()[i].q, in.samples()[i].q);
    EXPECT_DOUBLE_EQ(out.samples()[i].mu_hat, in.samples()[i].mu_hat);
    EXPECT_EQ(out.samples()[i].seed, in.samples()[i].seed);
    EXPECT_EQ(out.samples()[i].toy_index, in.samples()[i].toy_index);
  }
  std::remove(path.c_str());
}

TEST(DistributionIO, SeveralDistributionsShareOneFile) {
  const auto path = TempPath("poissonplr_dist_io_multi.root");
  std::remove(path.c_str());

  toys::Distribution null(stats::TestStatisticKind::Q0, 0.0, 0.0);
  toys::TestStatisticSample s;
  s.q = 1.5;
  null.Append(s);
  null.SetBookkeeping(1, 1, 0, false);

  {
    std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "RECREATE"));
    ASSERT_TRUE(f && !f->IsZombie());
    io::DistributionIO::Write(MakeDistribution(), *f, "alt");
    io::DistributionIO::Write(null, *f, "null");
    f->Close();
  }

  const auto back_null = io::DistributionIO::Read(path, "null");
  EXPECT_EQ(back_null.kind(), stats::TestStatisticKind::Q0);
  ASSERT_EQ(back_null.size(), 1u);
  EXPECT_DOUBLE_EQ(back_null.samples()[0].q, 1.5);
  EXPECT_FALSE(back_null.Cancelled());

  EXPECT_EQ(io::DistributionIO::Read(path, "alt").size(), 25u);
  EXPECT_THROW(io::DistributionIO::Read(path, "missing"), std::runtime_error);
  std::remove(path.c_str());
}

TEST(DistributionIO, MissingFileThrows) {
  EXPECT_THROW(io::DistributionIO::Read("/nonexistent/dist.root", "x"), std::runtime_error);
}

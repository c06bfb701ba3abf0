#include "poissonplr/io/DistributionIO.hh"

#include <TDirectory.h>
#include <TFile.h>
#include <TNamed.h>
#include <TParameter.h>
#include <TTree.h>

#include <memory>
#include <stdexcept>

namespace poissonplr::io {

void DistributionIO::Write(const toys::Distribution& dist, TDirectory& dir, const std::string& name) {
  TDirectory* d = dir.GetDirectory(name.c_str());
  if (!d) d = dir.mkdir(name.c_str());
  if (!d) throw std::runtime_error("DistributionIO: cannot create directory " + name);
  d->cd();

  const std::string ts = stats::ToString(dist.kind());
  TNamed("test_stat", ts.c_str()).Write("test_stat", TObject::kOverwrite);
  TParameter<double>("mu_hypothesis", dist.mu_hypothesis()).Write("mu_hypothesis", TObject::kOverwrite);
  TParameter<double>("mu_true", dist.mu_true()).Write("mu_true", TObject::kOverwrite);
  TParameter<Long64_t>("n_requested", dist.NRequested()).Write("n_requested", TObject::kOverwrite);
  TParameter<Long64_t>("n_completed", dist.NCompleted()).Write("n_completed", TObject::kOverwrite);
  TParameter<Long64_t>("n_failed", dist.NFailed()).Write("n_failed", TObject::kOverwrite);
  TParameter<int>("cancelled", dist.Cancelled() ? 1 : 0).Write("cancelled", TObject::kOverwrite);

  {
    TTree samples("samples", "Test statistic samples");
    samples.SetDirectory(d);

    double q = 0.0, mu_hyp = 0.0, mu_true = 0.0, mu_hat = 0.0;
    ULong64_t seed = 0;
    Long64_t toy_index = -1;

    samples.Branch("q", &q);
    samples.Branch("mu_hypothesis", &mu_hyp);
    samples.Branch("mu_true", &mu_true);
    samples.Branch("mu_hat", &mu_hat);
    samples.Branch("seed", &seed);
    samples.Branch("toy_index", &toy_index);

    for (const auto& s : dist.samples()) {
      q = s.q;
      mu_hyp = s.mu_hypothesis;
      mu_true = s.mu_true;
      mu_hat = s.mu_hat;
      seed = s.seed;
      toy_index = s.toy_index;
      samples.Fill();
    }
    samples.Write("samples", TObject::kOverwrite);
    samples.SetDirectory(nullptr);
  }
}

void DistributionIO::Write(const toys::Distribution& dist, const std::string& path, const std::string& name) {
  std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "UPDATE"));
  if (!f || f->IsZombie())
    throw std::runtime_error("DistributionIO: failed to open for UPDATE: " + path);
  Write(dist, *f, name);
  f->Close();
}

toys::Distribution DistributionIO::Read(TDirectory& dir, const std::string& name) {
  TDirectory* d = dir.GetDirectory(name.c_str());
  if (!d) throw std::runtime_error("DistributionIO: missing directory " + name);

  auto* ts = dynamic_cast<TNamed*>(d->Get("test_stat"));
  if (!ts) throw std::runtime_error("DistributionIO: missing test_stat in " + name);

  auto read_double = [d](const char* key) {
    auto* p = dynamic_cast<TParameter<double>*>(d->Get(key));
    if (!p) throw std::runtime_error("DistributionIO: missing TParameter<double> " + std::string(key));
    return p->GetVal();
  };
  auto read_long = [d](const char* key) {
    auto* p = dynamic_cast<TParameter<Long64_t>*>(d->Get(key));
    if (!p) throw std::runtime_error("DistributionIO: missing TParameter<Long64_t> " + std::string(key));
    return static_cast<long long>(p->GetVal());
  };
  auto* cancelled = dynamic_cast<TParameter<int>*>(d->Get("cancelled"));
  if (!cancelled) throw std::runtime_error("DistributionIO: missing cancelled flag in " + name);

  toys::Distribution out(stats::ParseTestStatisticKind(ts->GetTitle()),
                         read_double("mu_hypothesis"), read_double("mu_true"));

  std::unique_ptr<TTree> tree(dynamic_cast<TTree*>(d->Get("samples")));
  if (!tree) throw std::runtime_error("DistributionIO: missing samples tree in " + name);

  double q = 0.0, mu_hyp = 0.0, mu_true = 0.0, mu_hat = 0.0;
  ULong64_t seed = 0;
  Long64_t toy_index = -1;
  tree->SetBranchAddress("q", &q);
  tree->SetBranchAddress("mu_hypothesis", &mu_hyp);
  tree->SetBranchAddress("mu_true", &mu_true);
  tree->SetBranchAddress("mu_hat", &mu_hat);
  tree->SetBranchAddress("seed", &seed);
  tree->SetBranchAddress("toy_index", &toy_index);

  const Long64_t n = tree->GetEntries();
  for (Long64_t i = 0; i < n; ++i) {
    tree->GetEntry(i);
    toys::TestStatisticSample s;
    s.q = q;
    s.mu_hypothesis = mu_hyp;
    s.mu_true = mu_true;
    s.mu_hat = mu_hat;
    s.seed = seed;
    s.toy_index = toy_index;
    out.Append(s);
  }
  tree->ResetBranchAddresses();

  out.SetBookkeeping(read_long("n_requested"), read_long("n_completed"), read_long("n_failed"),
                     cancelled->GetVal() != 0);
  return out;
}

toys::Distribution DistributionIO::Read(const std::string& path, const std::string& name) {
  std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
  if (!f || f->IsZombie())
    throw std::runtime_error("DistributionIO: failed to open for READ: " + path);
  return Read(*f, name);
}

} // namespace poissonplr::io

#pragma once

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "pxu/common/diagnostic/diagnostic.hpp"
#include "pxu/common/diagnostic/diagnostic_sink.hpp"
#include "pxu/provider/classifier.hpp"
#include "pxu/provider/content_loader.hpp"
#include "pxu/provider/enumerator.hpp"
#include "pxu/unit/selection_list.hpp"
#include "pxu/unit/unit.hpp"

namespace pxu::provider {

class Provider;

// Units sharing one key. Collisions are kept in load order.
using UnitIndex =
    std::map<std::string, std::vector<unit::UnitPtr>, std::less<>>;

// Loads every file of a provider and indexes the resulting units.
//
// A file that fails to load contributes one problem and no content; the
// remaining files are still loaded. Load never throws for content errors; a
// directory that cannot be listed throws std::filesystem::filesystem_error.
class ContentAggregator final {
 public:
  ContentAggregator(
      const ContentEnumerator& enumerator, const Classifier& classifier,
      const Provider* provider);

  // Drop previous results and load everything again.
  void Load(const LoadOptions& options = {});

  [[nodiscard]] auto is_loaded() const -> bool {
    return is_loaded_;
  }
  [[nodiscard]] auto unit_list() const -> const std::vector<unit::UnitPtr>& {
    return unit_list_;
  }
  [[nodiscard]] auto selection_list_list() const
      -> const std::vector<unit::SelectionList>& {
    return selection_list_list_;
  }
  [[nodiscard]] auto problem_list() const -> const std::vector<Diagnostic>& {
    return problems_.GetDiagnostics();
  }
  // Qualified identifier -> units.
  [[nodiscard]] auto id_map() const -> const UnitIndex& {
    return id_map_;
  }
  // File path -> file units.
  [[nodiscard]] auto path_map() const -> const UnitIndex& {
    return path_map_;
  }

 private:
  void Clear();
  void AddUnit(const unit::UnitPtr& unit);
  void AddProblem(Diagnostic problem);

  const ContentEnumerator& enumerator_;
  const Classifier& classifier_;
  const Provider* provider_;
  std::array<std::unique_ptr<ContentLoader>, 3> loaders_;

  bool is_loaded_ = false;
  std::vector<unit::UnitPtr> unit_list_;
  std::vector<unit::SelectionList> selection_list_list_;
  DiagnosticSink problems_;
  UnitIndex id_map_;
  UnitIndex path_map_;
};

}  // namespace pxu::provider

#include "provider.hpp"

namespace brewrecents {

namespace {

const CatalogInfo FORMULA_INFO = {"homebrew/core", "Formula/", ".rb", "formulae"};
const CatalogInfo CASK_INFO = {"homebrew/cask", "Casks/", ".rb", "casks"};

} // anonymous namespace

const CatalogInfo& catalog_info(Catalog catalog) {
    return catalog == Catalog::Cask ? CASK_INFO : FORMULA_INFO;
}

const char* diff_filter(Category category) {
    return category == Category::Updated ? "M" : "A";
}

} // namespace brewrecents

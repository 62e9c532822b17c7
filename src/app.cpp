#include "app.hpp"
#include "history.hpp"
#include "logging.hpp"
#include "providers/brew.hpp"
#include "report.hpp"
#include <utility>

#include <spdlog/spdlog.h>

namespace brewrecents {

// Factory function to create providers
ProviderPtr create_provider(const std::string& name) {
    if (name == "brew") {
        return std::make_unique<BrewProvider>();
    }
    return nullptr;
}

App::App(Options options, ProviderPtr provider)
    : options_(std::move(options)), provider_(std::move(provider)) {
}

bool App::init() {
    if (!provider_) {
        provider_ = create_provider("brew");
    }

    if (!provider_) {
        error_ = "No package provider available.";
        return false;
    }

    if (!provider_->is_available()) {
        error_ = provider_->unavailable_reason();
        return false;
    }

    spdlog::debug("Using provider '{}'", provider_->name());
    return true;
}

int App::run(std::ostream& out) {
    if (!provider_) {
        error_ = "No provider initialized";
        return 1;
    }

    spdlog::debug("days={} truncate={} formula={} cask={} new={} updated={} "
                  "dim={} hide={} color={} plain={}",
                  options_.days, options_.style.truncate_at,
                  options_.show_formula, options_.show_cask,
                  options_.show_new, options_.show_updated,
                  options_.style.dim_inspected, options_.style.hide_inspected,
                  options_.style.color, options_.style.plain);

    MembershipSets sets = load_membership();

    ReportAssembler assembler(*provider_, sets, options_);
    Report report = assembler.assemble();

    int width = output_width();
    spdlog::debug("Output width: {} (tty: {})", width, terminal_.is_tty());

    print_report(out, report, width);
    out.flush();
    return 0;
}

MembershipSets App::load_membership() const {
    MembershipSets sets;

    {
        ScopedTimer timer("cache_installed_packages");
        sets.installed = provider_->installed_packages();
    }

    {
        ScopedTimer timer("cache_looked_up_packages");
        std::string path = options_.history_file.empty()
            ? default_history_path()
            : options_.history_file;
        sets.inspected = load_inspected_packages(path);
    }

    spdlog::debug("{} installed, {} looked up", sets.installed.size(), sets.inspected.size());
    return sets;
}

int App::output_width() const {
    if (options_.width > 0) {
        return options_.width;
    }
    return terminal_.output_width();
}

} // namespace brewrecents

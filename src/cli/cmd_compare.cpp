// mutsel compare: relative error of a snapshot against reference arrays
//
// The reference file holds one numeric array per line (text or .gz), e.g. a
// trajectory exported by another implementation. Arrays are matched to the
// snapshot row by row.

#include "subcommand.hpp"
#include "args.hpp"
#include "mutsel/errors.hpp"
#include "mutsel/snapshot.hpp"
#include "mutsel/statistics.hpp"

#include <iostream>
#include <vector>

namespace mutsel {
namespace cli {

namespace {

std::vector<std::vector<double>> comparison_rows(const Snapshot& s, const std::string& target) {
    if (target == "trajectory") return s.trajectory;
    if (target == "normalized") {
        std::vector<std::vector<double>> rows = s.trajectory;
        for (size_t k = 0; k < rows.size(); ++k) {
            for (double& x : rows[k]) x /= s.sums[k];
        }
        return rows;
    }
    if (target == "equilibrium") {
        if (!s.has_equilibrium) throw InvalidArgument("snapshot holds no equilibrium");
        return {s.equilibrium};
    }
    const MeanVarianceSeries mv = snapshot_mean_and_variance(s);
    return {target == "mean" ? mv.mean : mv.variance};
}

}  // namespace

int cmd_compare(int argc, char* argv[]) {
    CompareOptions opts;
    try {
        opts = parse_compare_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') std::cerr << e.what() << "\n";
        return e.exit_code();
    }

    try {
        const Snapshot snapshot = read_snapshot(opts.snapshot_file);
        const std::vector<std::vector<double>> actual = comparison_rows(snapshot, opts.target);
        const std::vector<std::vector<double>> desired = read_numeric_arrays(opts.reference_file);
        const double error = maximum_absolute_relative_error(actual, desired);

        std::cout << "target\t" << opts.target << "\n";
        std::cout << "arrays\t" << actual.size() << "\n";
        std::cout << "max_abs_rel_error\t" << error << "\n";
        if (opts.max_error >= 0.0 && !(error <= opts.max_error)) {
            std::cerr << "Error: relative error " << error << " exceeds " << opts.max_error << "\n";
            return 1;
        }
        return 0;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {
const SubcommandRegistrar registrar({"compare", "<snapshot> <reference>",
                                     "Compare a snapshot with reference arrays",
                                     cmd_compare, 30});
}

}  // namespace cli
}  // namespace mutsel

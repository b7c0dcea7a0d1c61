#include "sa.h"
#include "rotation.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>

namespace rota {

struct HomeBlock
{
    int start;
    int end; // inclusive
};

static std::vector<HomeBlock> home_blocks(const std::vector<bool> &row)
{
    std::vector<HomeBlock> blocks;
    int start = -1;
    for (int i = 0; i < (int)row.size(); ++i)
    {
        if (!row[i])
        {
            if (start == -1)
                start = i;
        }
        else if (start != -1)
        {
            blocks.push_back({start, i - 1});
            start = -1;
        }
    }
    if (start != -1)
        blocks.push_back({start, (int)row.size() - 1});
    return blocks;
}

// --- cost eval over the full grid ---
GlobalCost eval_global(const ScheduleGrid &S, const SchedulingContext &ctx,
                       int target_capacity, const PenaltyWeights &W)
{
    GlobalCost gc{};
    gc.capacity = capacity_variance_cost(S.headcount, target_capacity, W);
    for (size_t p = 0; p < S.base.size(); ++p)
        add_person_cost(S.base[p], ctx.hard[p], ctx.rotations[p], W, gc);
    return gc;
}

// random phase per person, constraints overlaid as Home
static ScheduleGrid init_random(const SchedulingContext &ctx, std::mt19937_64 &rng)
{
    ScheduleGrid S(ctx.people.size(), ctx.total_days);
    for (size_t p = 0; p < ctx.people.size(); ++p)
    {
        const RotationConfig &r = ctx.rotations[p];
        const int offset = std::uniform_int_distribution<int>(0, r.cycle() - 1)(rng);
        for (int d = 0; d < ctx.total_days; ++d)
            S.base[p][d] = is_base_day(r, offset, d);
        for (int d : ctx.hard[p])
            if (d >= 0 && d < ctx.total_days)
                S.base[p][d] = false;
    }
    S.recount();
    return S;
}

SA_Result run_sa(const SchedulingContext &ctx, const SA_Config &cfg)
{
    std::mt19937_64 rng(cfg.seed);
    std::uniform_real_distribution<double> U(0.0, 1.0);

    SA_Result res;
    res.target_capacity = (int)std::lround(theoretical_capacity(ctx.rotations));

    // --- initialize state ---
    ScheduleGrid cur = init_random(ctx, rng);
    GlobalCost cur_cost = eval_global(cur, ctx, res.target_capacity, cfg.W);
    res.best_state = cur;
    res.best_cost = cur_cost;

    if (cfg.verbose)
    {
        std::map<int, int> hist;
        for (int h : cur.headcount)
            hist[h]++;
        std::cout << "[sa] init: people=" << ctx.people.size()
                  << " days=" << ctx.total_days
                  << " target=" << res.target_capacity
                  << " cost=" << cur_cost.total()
                  << " (constraint=" << cur_cost.constraint
                  << " fatigue=" << cur_cost.fatigue
                  << " frag=" << cur_cost.fragmentation
                  << " cap=" << cur_cost.capacity
                  << " equity=" << cur_cost.equity << ")\n";
        std::cout << "headcount_histogram: ";
        for (const auto &kv : hist)
            std::cout << kv.first << "->" << kv.second << " ";
        std::cout << "\n";
    }

    if (ctx.people.empty() || ctx.total_days <= 0)
        return res;

    double T = cfg.T0;
    std::uniform_int_distribution<size_t> pick(0, ctx.people.size() - 1);

    for (int it = 1; it <= cfg.iters; ++it, T *= cfg.alpha)
    {
        const size_t p = pick(rng);
        const auto blocks = home_blocks(cur.base[p]);
        if (blocks.empty())
            continue;

        const HomeBlock b = blocks[std::uniform_int_distribution<size_t>(0, blocks.size() - 1)(rng)];
        int ns = b.start, ne = b.end;
        if (U(rng) < 0.5)
        {
            // shift
            const int s = U(rng) < 0.5 ? 1 : -1;
            ns += s;
            ne += s;
        }
        else if (U(rng) < 0.5)
        {
            // expand
            if (U(rng) < 0.5) ne++; else ns--;
        }
        else if (ne > ns)
        {
            // shrink, never to nothing
            if (U(rng) < 0.5) ne--; else ns++;
        }

        if (ns < 0 || ne >= ctx.total_days)
            continue;

        // Days leaving the block become Base: none of them may be a hard day.
        bool invalid = false;
        for (int i = b.start; i <= b.end && !invalid; ++i)
            if ((i < ns || i > ne) && ctx.is_hard(p, i))
                invalid = true;
        if (invalid)
        {
            res.invalid++;
            continue;
        }

        const std::vector<bool> old_row = cur.base[p];
        const int lo = std::min(b.start, ns), hi = std::max(b.end, ne);
        for (int i = lo; i <= hi; ++i)
            cur.set(p, i, !(i >= ns && i <= ne));

        const GlobalCost nxt_cost = eval_global(cur, ctx, res.target_capacity, cfg.W);
        const double dE = nxt_cost.total() - cur_cost.total();
        const bool accept = (dE <= 0) || (U(rng) < std::exp(-dE / std::max(1e-6, T)));
        if (accept)
        {
            res.accepted++;
            cur_cost = nxt_cost;
            if (cur_cost.total() < res.best_cost.total())
            {
                res.best_state = cur;
                res.best_cost = cur_cost;
            }
        }
        else
        {
            res.rejected++;
            for (int i = lo; i <= hi; ++i)
                cur.set(p, i, old_row[i]);
        }

        if (cfg.verbose && (it % (cfg.log_every > 0 ? cfg.log_every : 2000) == 0))
        {
            std::cout << "[sa it " << it << "] "
                      << "T=" << std::setprecision(3) << T
                      << " cur=" << std::setprecision(10) << cur_cost.total()
                      << " best=" << res.best_cost.total()
                      << " dE=" << dE << "\n";
        }
    }
    return res;
}

StrategyOutput anneal_strategy(const SchedulingContext &ctx)
{
    SA_Config cfg;
    cfg.T0 = ctx.opts.sa_t0;
    cfg.alpha = ctx.opts.sa_alpha;
    cfg.iters = ctx.opts.sa_iterations;
    cfg.seed = ctx.opts.rng_seed;
    cfg.verbose = ctx.opts.verbose;
    cfg.log_every = ctx.opts.log_every;

    SA_Result r = run_sa(ctx, cfg);
    if (cfg.verbose)
    {
        std::cout << "[sa] done: best=" << r.best_cost.total()
                  << " accepted=" << r.accepted
                  << " rejected=" << r.rejected
                  << " invalid=" << r.invalid << "\n";
    }

    StrategyOutput out;
    out.grid = std::move(r.best_state);
    out.min_staff = ctx.min_staff;
    return out;
}

} // namespace rota

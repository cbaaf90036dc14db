/***
 * Name: cargo_rpl::driver::RenderHelp / PrintHelp
 * Purpose: Produce the `cargo rpl --help` text.
 * Inputs: color (and out for PrintHelp)
 * Outputs: Help text
 * Theory of Operation: One compile-time template rendered through RenderMarkup.
 */
#include "cargo_rpl/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

namespace cargo_rpl::driver {

namespace {
constexpr std::string_view kHelpText = R"(Checks a package to catch common mistakes and improve your Rust code.

{h}Usage{r}:
    {f}cargo rpl{r} {a}[OPTIONS] [--] [<ARGS>...]{r}

{h}Common options:{r}
    {f}--no-deps{r}                Run RPL only on the given crate, without linting the dependencies
    {f}--fix{r}                    Automatically apply lint suggestions. This flag implies {a}--no-deps{r} and {a}--all-targets{r}
    {f}-h{r}, {f}--help{r}               Print this message
    {f}-V{r}, {f}--version{r}            Print version info and exit
    {f}--explain [LINT]{r}         Print the documentation for a given lint

See all options with {f}cargo check --help{r}.

{h}Allowing / Denying lints{r}

To allow or deny a lint from the command line you can use {f}cargo rpl --{r} with:

    {f}-W{r} / {f}--warn{r} {a}[LINT]{r}       Set lint warnings
    {f}-A{r} / {f}--allow{r} {a}[LINT]{r}      Set lint allowed
    {f}-D{r} / {f}--deny{r} {a}[LINT]{r}       Set lint denied
    {f}-F{r} / {f}--forbid{r} {a}[LINT]{r}     Set lint forbidden

{h}Manifest Options:{r}
    {f}--manifest-path{r} {a}<PATH>{r}  Path to Cargo.toml
    {f}--frozen{r}                Require Cargo.lock and cache are up to date
    {f}--locked{r}                Require Cargo.lock is up to date
    {f}--offline{r}               Run without accessing the network
)";
}  // namespace

auto RenderHelp(const bool color) -> std::string { return detail::RenderMarkup(kHelpText, color); }

auto PrintHelp(std::ostream& out, const bool color) -> void { out << RenderHelp(color) << '\n'; }

}  // namespace cargo_rpl::driver

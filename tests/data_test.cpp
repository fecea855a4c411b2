#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "data/csv_bars.hpp"
#include "data/report.hpp"
#include "data/universe.hpp"
#include "strategy/win_rate.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace {

fs::path temp_dir(const std::string& name){
    const auto d = fs::temp_directory_path() / name;
    fs::remove_all(d);
    fs::create_directories(d);
    return d;
}

} // namespace

TEST(CsvBars, HeaderAndMalformedRows) {
    std::istringstream in(
        "timestamp,open,high,low,close,volume\n"
        "1000,1,2,0.5,1.5,100\n"
        "2000,1.5,2.5,1,2,200\r\n"
        "garbage\n"
        "\n"
        "3000,2,3,1.5,2.5,300\n");
    const auto bars = data::parse_csv(in);
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].timestamp_ms, 1000);
    EXPECT_DOUBLE_EQ(bars[1].close, 2.0);
    EXPECT_DOUBLE_EQ(bars[2].volume, 300.0);
}

TEST(CsvBars, NonIncreasingTimestampsThrow) {
    std::istringstream in("1000,1,2,0.5,1.5,100\n1000,1,2,0.5,1.5,100\n");
    EXPECT_THROW(data::parse_csv(in), std::runtime_error);
}

TEST(CsvBars, LoadInstrumentMissingHorizonIsEmpty) {
    const auto dir = temp_dir("sigscan_csv_test");
    std::ofstream(dir / "BTCUSDT_medium.csv") << "1,1,1,1,1,1\n2,1,1,1,1,1\n";
    const auto inst = data::load_instrument(dir.string(), "BTCUSDT");
    EXPECT_EQ(inst.symbol, "BTCUSDT");
    EXPECT_TRUE(inst.at(core::Horizon::Short).empty());
    EXPECT_EQ(inst.at(core::Horizon::Medium).size(), 2u);
    EXPECT_TRUE(inst.at(core::Horizon::Long).empty());
    fs::remove_all(dir);
}

TEST(CsvBars, CorruptFileOnlyEmptiesItsHorizon) {
    const auto dir = temp_dir("sigscan_csv_corrupt_test");
    std::ofstream(dir / "BADUSDT_short.csv") << "2000,1,1,1,1,1\n1000,1,1,1,1,1\n";
    std::ofstream(dir / "BADUSDT_medium.csv") << "1,1,1,1,1,1\n2,1,1,1,1,1\n3,1,1,1,1,1\n";
    std::ofstream(dir / "OKUSDT_short.csv") << "1,1,1,1,1,1\n";

    core::InstrumentBars bad;
    ASSERT_NO_THROW(bad = data::load_instrument(dir.string(), "BADUSDT"));
    EXPECT_TRUE(bad.at(core::Horizon::Short).empty());
    EXPECT_EQ(bad.at(core::Horizon::Medium).size(), 3u);

    const auto ok = data::load_instrument(dir.string(), "OKUSDT");
    EXPECT_EQ(ok.at(core::Horizon::Short).size(), 1u);
    fs::remove_all(dir);
}

TEST(Universe, TopByTurnoverWithSuffix) {
    const std::vector<data::Ticker> t{
        {"BTCUSDT", 900.0}, {"ETHUSDT", 500.0}, {"ETHBTC", 10000.0},
        {"XRPUSDT", 500.0}, {"ADAUSDT", 100.0}};
    const auto top = data::select_top_by_volume(t, 3, "USDT");
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0], "BTCUSDT");
    EXPECT_EQ(top[1], "ETHUSDT");
    EXPECT_EQ(top[2], "XRPUSDT");
    EXPECT_EQ(data::select_top_by_volume(t, 100, "USDT").size(), 4u);
}

TEST(Universe, LoadTickersAndAccount) {
    const auto dir = temp_dir("sigscan_universe_test");
    std::ofstream(dir / "tickers.json")
        << R"([{"symbol":"BTCUSDT","turnover24h":"12345.5"},{"symbol":"ETHUSDT","turnover24h":99},{"foo":1}])";
    std::ofstream(dir / "account.json") << R"({"equity": 2500})";

    const auto t = data::load_tickers((dir / "tickers.json").string());
    ASSERT_EQ(t.size(), 2u);
    EXPECT_DOUBLE_EQ(t[0].turnover_24h, 12345.5);
    EXPECT_DOUBLE_EQ(t[1].turnover_24h, 99.0);

    const auto a = data::load_account((dir / "account.json").string());
    EXPECT_DOUBLE_EQ(a.equity, 2500.0);
    EXPECT_DOUBLE_EQ(a.leverage, 1.0);
    EXPECT_THROW(data::load_account((dir / "missing.json").string()), std::runtime_error);
    fs::remove_all(dir);
}

TEST(WinRateBook, RecordsAndLoads) {
    strategy::WinRateBook book;
    book.record("BTCUSDT", core::Regime::Breakout, core::Style::Swing, true);
    book.record("BTCUSDT", core::Regime::Breakout, core::Style::Swing, false);
    book.record("BTCUSDT", core::Regime::Breakout, core::Style::Swing, true);
    EXPECT_NEAR(*book.win_rate("BTCUSDT", core::Regime::Breakout, core::Style::Swing), 2.0/3.0, 1e-12);
    EXPECT_FALSE(book.win_rate("BTCUSDT", core::Regime::Mean, core::Style::Swing));
    EXPECT_FALSE(book.win_rate("BTCUSDT", core::Regime::Breakout, core::Style::Swing, 5));

    const auto dir = temp_dir("sigscan_history_test");
    std::ofstream(dir / "history.json") << R"([
        {"symbol":"ETHUSDT","regime":"MEAN","style":"scalp","profit":12.5},
        {"symbol":"ETHUSDT","regime":"mean","style":"scalp","profit":-3},
        {"symbol":"ETHUSDT","regime":"sideways","style":"scalp","profit":1},
        {"symbol":"ETHUSDT","regime":"mean","style":"scalp"}
    ])";
    const auto loaded = strategy::WinRateBook::load((dir / "history.json").string());
    EXPECT_EQ(loaded.size(), 1u);
    const auto rec = loaded.get("ETHUSDT", core::Regime::Mean, core::Style::Scalp);
    EXPECT_EQ(rec.wins, 1u);
    EXPECT_EQ(rec.losses, 1u);
    fs::remove_all(dir);
}

TEST(Report, JsonShapeAndConsoleTable) {
    strategy::ScanReport rep;
    rep.scanned = 3;
    rep.skipped[static_cast<std::size_t>(core::ScanError::InsufficientData)] = 2;
    exec::TradeStructure t;
    t.entry = 100.0; t.take_profit = 103.0; t.stop_loss = 98.5;
    rep.ranked.push_back({testutil::make_signal("BTCUSDT", core::Side::Long, 82.0, 91.0), t});

    const auto j = data::report_json(rep);
    EXPECT_EQ(j.at("scanned").get<std::size_t>(), 3u);
    EXPECT_EQ(j.at("skipped").at("insufficient_data").get<std::size_t>(), 2u);
    EXPECT_EQ(j.at("skipped").at("filter_veto").get<std::size_t>(), 0u);
    ASSERT_EQ(j.at("signals").size(), 1u);
    const auto& s = j.at("signals")[0];
    EXPECT_EQ(s.at("signal").at("symbol"), "BTCUSDT");
    EXPECT_DOUBLE_EQ(s.at("trade").at("take_profit").get<double>(), 103.0);

    const auto table = data::format_top(rep.ranked, 5);
    EXPECT_NE(table.find("BTCUSDT"), std::string::npos);
    EXPECT_TRUE(data::format_top(rep.ranked, 0).empty());
}

#include <vector>
#include <string>
#include <unordered_map>

#include <gtest/gtest.h>

#include "specindex.h"
#include "util.hpp"
#include "csv.hpp"
#include "indices.hpp"
#include "scene.hpp"
#include "report.hpp"
#include "test_util.hpp"
#include "csv_reader.hpp"

using namespace specindex;
using namespace specindex::report;
using namespace specindex::scene;
using namespace specindex::index;
using namespace specindex::csv;
using namespace specindex::test;

namespace {

	SceneReport sampleReport() {
		SceneReport r("sceneA");
		IndexResult ndvi(Index::NDVI);
		ndvi.status = Status::Success;
		r.results.push_back(ndvi);
		IndexResult nbr(Index::NBR);
		nbr.status = Status::Skipped;
		nbr.reason = "missing B7";
		r.results.push_back(nbr);
		IndexResult evi(Index::EVI);
		evi.status = Status::Failed;
		evi.reason = "Failed to write out/EVI.tif: disk full, \"no space\"";
		r.results.push_back(evi);
		r.elapsed = 1.5;
		return r;
	}

} // anon

TEST(ReportTest, Cells) {
	SceneReport r = sampleReport();
	EXPECT_EQ("success", ReportWriter::cell(r.result(Index::NDVI)));
	EXPECT_EQ("skipped: missing B7", ReportWriter::cell(r.result(Index::NBR)));
	EXPECT_EQ(0u, ReportWriter::cell(r.result(Index::EVI)).find("failed: Failed to write"));
	EXPECT_EQ("failed: not run", ReportWriter::cell(r.result(Index::GCI)));
}

TEST(ReportTest, HeaderAndRow) {
	std::vector<Index> indices = {Index::NDVI, Index::NBR};
	std::vector<std::string> header = ReportWriter::header(indices);
	ASSERT_EQ(4u, header.size());
	EXPECT_EQ("scene", header[0]);
	EXPECT_EQ("NDVI", header[1]);
	EXPECT_EQ("NBR", header[2]);
	EXPECT_EQ("time_sec", header[3]);

	std::vector<std::string> row = ReportWriter::row(sampleReport(), indices);
	ASSERT_EQ(4u, row.size());
	EXPECT_EQ("sceneA", row[0]);
	EXPECT_EQ("1.50", row[3]);
}

TEST(ReportTest, QuotesFields) {
	EXPECT_EQ("plain", CSVWriter::quote("plain"));
	EXPECT_EQ("\"a,b\"", CSVWriter::quote("a,b"));
	EXPECT_EQ("\"say \"\"hi\"\"\"", CSVWriter::quote("say \"hi\""));
	EXPECT_EQ("\"two\nlines\"", CSVWriter::quote("two\nlines"));
}

TEST(ReportTest, WriteAndRead) {
	TempDir tmp;
	std::string filename = specindex::util::Util::join(tmp.join("out"), ReportWriter::summaryName());
	std::vector<Index> indices = {Index::NDVI, Index::NBR, Index::EVI};

	SceneReport fatal("sceneB");
	fatal.fail(indices, "Scene directory not found: data/input/sceneB");
	fatal.elapsed = 0.004;

	ReportWriter::write(filename, {sampleReport(), fatal}, indices);

	CSVReader reader(filename);
	std::vector<std::string> header = reader.header();
	ASSERT_EQ(5u, header.size());
	EXPECT_EQ("EVI", header[3]);

	std::unordered_map<std::string, std::string> row;
	ASSERT_TRUE(reader.next(row));
	EXPECT_EQ("sceneA", row["scene"]);
	EXPECT_EQ("success", row["NDVI"]);
	EXPECT_EQ("skipped: missing B7", row["NBR"]);
	EXPECT_EQ("failed: Failed to write out/EVI.tif: disk full, \"no space\"", row["EVI"]);
	EXPECT_EQ("1.50", row["time_sec"]);

	ASSERT_TRUE(reader.next(row));
	EXPECT_EQ("sceneB", row["scene"]);
	EXPECT_EQ("failed: Scene directory not found: data/input/sceneB", row["NDVI"]);
	EXPECT_EQ("0.00", row["time_sec"]);

	EXPECT_FALSE(reader.next(row));
}

TEST(ReportTest, SummaryName) {
	std::string name = ReportWriter::summaryName();
	EXPECT_EQ(0u, name.find("summary_"));
	EXPECT_EQ(27u, name.size());
	EXPECT_EQ(".csv", name.substr(name.size() - 4));
}

#include <gtest/gtest.h>

#include "common/diagnostic.h"
#include "common/source_mgr.h"

using namespace sqlscan;

TEST(SourceManager, FormatsLocations) {
  SourceManager mgr;
  auto fid = mgr.AddSource("<arg1>", "SELECT *\r\nFROM t");
  EXPECT_EQ(fid, 1u);
  EXPECT_EQ(mgr.SourceName(fid), "<arg1>");
  EXPECT_EQ(mgr.FormatLoc({fid, 2, 3}), "<arg1>:2:3");
  EXPECT_EQ(mgr.FormatLoc({}), "<unknown location>");
  EXPECT_EQ(mgr.GetLineText({fid, 1, 1}), "SELECT *");
  EXPECT_EQ(mgr.GetLineText({fid, 2, 1}), "FROM t");
  EXPECT_EQ(mgr.GetLineText({fid, 3, 1}), "");
}

TEST(SourceManager, UnknownSource) {
  SourceManager mgr;
  EXPECT_EQ(mgr.SourceName(7), "<unknown>");
  EXPECT_EQ(mgr.SourceContent(0), "");
}

TEST(DiagEngine, CountsBySeverity) {
  SourceManager mgr;
  DiagEngine diag(mgr);
  diag.SetQuiet(true);
  diag.Note({}, "n");
  diag.Warning({}, "w");
  EXPECT_FALSE(diag.HasErrors());
  diag.Error({}, "e");
  diag.Fatal({}, "f");
  EXPECT_EQ(diag.WarningCount(), 1u);
  EXPECT_EQ(diag.ErrorCount(), 2u);
  ASSERT_EQ(diag.Diagnostics().size(), 4u);
  EXPECT_EQ(diag.Diagnostics()[3].severity, DiagSeverity::kFatal);
}

TEST(DiagEngine, WarningsAsErrors) {
  SourceManager mgr;
  DiagEngine diag(mgr);
  diag.SetQuiet(true);
  diag.SetWarningsAsErrors(true);
  diag.Warning({}, "statement contains no tokens");
  EXPECT_TRUE(diag.HasErrors());
  EXPECT_EQ(diag.Diagnostics()[0].severity, DiagSeverity::kError);
}

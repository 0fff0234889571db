// Copyright (c) 2024 liudegui. MIT License.
// Tests for the erased data model: AnyValueKind, AnyArguments, AnyRow,
// AnyQueryResult, AnyStream, AnyConnectOptions.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "anydb/any_connect_options.hpp"
#include "anydb/any_query_result.hpp"
#include "anydb/any_row.hpp"
#include "anydb/any_stream.hpp"
#include "anydb/any_type_info.hpp"
#include "anydb/any_value.hpp"

using namespace anydb;

TEST_CASE("AnyTypeInfo: names and unknown tags", "[any_value]") {
  REQUIRE(std::strcmp(AnyTypeInfo{AnyTypeInfoKind::kBigInt}.Name(), "BIGINT") == 0);
  REQUIRE(AnyTypeInfo{}.IsNull());
  AnyTypeInfoKind future = static_cast<AnyTypeInfoKind>(200);
  REQUIRE_FALSE(IsKnownKind(future));
  REQUIRE(AnyTypeInfoKindName(future) == nullptr);
  REQUIRE(std::strcmp(AnyTypeInfo{future}.Name(), "UNKNOWN") == 0);
  REQUIRE(IsIntegerKind(AnyTypeInfoKind::kSmallInt));
  REQUIRE_FALSE(IsIntegerKind(AnyTypeInfoKind::kDouble));
}

TEST_CASE("AnyValueKind: typed factories", "[any_value]") {
  REQUIRE(AnyValueKind::Null().IsNull());
  REQUIRE(AnyValueKind::SmallInt(-3).Kind() == AnyTypeInfoKind::kSmallInt);
  REQUIRE(AnyValueKind::SmallInt(-3).IntValue() == -3);
  REQUIRE(AnyValueKind::BigInt(INT64_C(1) << 40).IntValue() == (INT64_C(1) << 40));
  REQUIRE(AnyValueKind::Real(1.5f).FloatValue() == Catch::Approx(1.5));
  REQUIRE(AnyValueKind::Double(2.25).TypeInfo().kind == AnyTypeInfoKind::kDouble);
  REQUIRE(AnyValueKind::Text("abc").TextString() == "abc");
  REQUIRE(AnyValueKind::Blob({1, 2, 3}).BlobBytes() == std::vector<uint8_t>{1, 2, 3});
}

TEST_CASE("AnyValueKind: borrowed payload references the buffer", "[any_value]") {
  char buf[] = "hello";
  AnyValueKind v = AnyValueKind::TextRef(buf, 5);
  REQUIRE(v.IsBorrowed());
  REQUIRE(v.GetOwnership() == Ownership::kBorrowed);
  REQUIRE(v.Data() == reinterpret_cast<const uint8_t*>(buf));

  buf[0] = 'j';
  REQUIRE(v.TextString() == "jello");

  v.MakeOwned();
  REQUIRE_FALSE(v.IsBorrowed());
  buf[0] = 'x';
  REQUIRE(v.TextString() == "jello");
}

TEST_CASE("AnyValueKind: tagged values keep unknown tags", "[any_value]") {
  AnyValueKind v = AnyValueKind::Tagged(static_cast<AnyTypeInfoKind>(200));
  REQUIRE(static_cast<unsigned>(v.Kind()) == 200u);
  REQUIRE(v.Size() == 0);
}

TEST_CASE("AnyArguments: Add overloads pick kinds", "[any_value]") {
  AnyArguments args;
  args.Add(static_cast<int16_t>(1));
  args.Add(static_cast<int32_t>(2));
  args.Add(static_cast<int64_t>(3));
  args.Add(1.0f);
  args.Add(2.0);
  args.Add("borrowed");
  args.Add(std::string("owned"));
  args.AddNull();
  args.Add(static_cast<const char*>(nullptr));

  REQUIRE(args.Len() == 9);
  const std::vector<AnyValueKind>& v = args.Values();
  REQUIRE(v[0].Kind() == AnyTypeInfoKind::kSmallInt);
  REQUIRE(v[1].Kind() == AnyTypeInfoKind::kInteger);
  REQUIRE(v[2].Kind() == AnyTypeInfoKind::kBigInt);
  REQUIRE(v[3].Kind() == AnyTypeInfoKind::kReal);
  REQUIRE(v[4].Kind() == AnyTypeInfoKind::kDouble);
  REQUIRE(v[5].Kind() == AnyTypeInfoKind::kText);
  REQUIRE(v[5].IsBorrowed());
  REQUIRE(v[6].Kind() == AnyTypeInfoKind::kText);
  REQUIRE_FALSE(v[6].IsBorrowed());
  REQUIRE(v[7].IsNull());
  REQUIRE(v[8].IsNull());

  args.Clear();
  REQUIRE(args.Empty());
}

TEST_CASE("AnyRow: accessors by index and name", "[any_value]") {
  auto columns = std::make_shared<std::vector<AnyColumn>>();
  columns->push_back({0, "id", AnyTypeInfo{AnyTypeInfoKind::kBigInt}});
  columns->push_back({1, "score", AnyTypeInfo{AnyTypeInfoKind::kDouble}});
  columns->push_back({2, "name", AnyTypeInfo{AnyTypeInfoKind::kText}});
  columns->push_back({3, "note", AnyTypeInfo{AnyTypeInfoKind::kText}});
  auto names = std::make_shared<ColumnNameMap>();
  for (const AnyColumn& c : *columns) { (*names)[c.name] = c.ordinal; }

  std::vector<AnyValueKind> values;
  values.push_back(AnyValueKind::BigInt(7));
  values.push_back(AnyValueKind::Double(2.5));
  values.push_back(AnyValueKind::Text("Alice"));
  values.push_back(AnyValueKind::Null());
  AnyRow row(columns, names, std::move(values));

  REQUIRE(row.NumFields() == 4);
  REQUIRE(row.FieldIndex("name") == 2);
  REQUIRE(row.FieldIndex("missing") == -1);
  REQUIRE(std::strcmp(row.FieldName(1), "score") == 0);
  REQUIRE(row.GetInt("id") == 7);
  REQUIRE(row.GetDouble(0) == Catch::Approx(7.0));
  REQUIRE(row.GetInt64(1) == 2);
  REQUIRE(row.GetString("name") == "Alice");
  REQUIRE(row.FieldIsNull(3));
  REQUIRE(row.GetString(3, "n/a") == "n/a");
  REQUIRE(row.GetInt(99, -1) == -1);
  REQUIRE(row.Value(-1) == nullptr);
  REQUIRE(row.ColumnNames() == names);
}

TEST_CASE("AnyQueryResult: Extend folds summaries", "[any_value]") {
  AnyQueryResult total;
  AnyQueryResult a;
  a.rows_affected = 2;
  AnyQueryResult b;
  b.rows_affected = 3;
  b.has_last_insert_id = true;
  b.last_insert_id = 11;

  total.Extend(a);
  int64_t id = 0;
  REQUIRE_FALSE(total.LastInsertId(&id));
  total.Extend(b);
  REQUIRE(total.RowsAffected() == 5);
  REQUIRE(total.LastInsertId(&id));
  REQUIRE(id == 11);
}

namespace {

// Emits `rows` rows, one summary, then ends (or fails when `fail` is set).
class CountingSource : public AnyStreamSource {
 public:
  CountingSource(int rows, bool fail) : rows_(rows), fail_(fail) {}

  StreamStatus Next(AnyItem* out, Error* out_error) override {
    if (produced_ < rows_) {
      ++produced_;
      *out = AnyItem::FromRow(AnyRow());
      return StreamStatus::kItem;
    }
    if (!summary_sent_) {
      summary_sent_ = true;
      AnyQueryResult r;
      r.rows_affected = 4;
      *out = AnyItem::FromResult(r);
      return StreamStatus::kItem;
    }
    if (fail_) {
      AssignError(out_error, Error::Make(ErrorCode::kError, "boom"));
      return StreamStatus::kError;
    }
    return StreamStatus::kEnd;
  }

 private:
  int rows_;
  bool fail_;
  int produced_ = 0;
  bool summary_sent_ = false;
};

}  // namespace

TEST_CASE("AnyStream: items then end, then stays ended", "[any_value]") {
  AnyStream stream(std::make_unique<CountingSource>(2, false));
  AnyItem item;
  REQUIRE(stream.Next(&item) == StreamStatus::kItem);
  REQUIRE(item.IsRow());
  REQUIRE(stream.Next(&item) == StreamStatus::kItem);
  REQUIRE(stream.Next(&item) == StreamStatus::kItem);
  REQUIRE(item.IsResult());
  REQUIRE(stream.Next(&item) == StreamStatus::kEnd);
  REQUIRE(stream.Done());
  REQUIRE(stream.Next(&item) == StreamStatus::kEnd);
}

TEST_CASE("AnyStream: a terminal error is reported once", "[any_value]") {
  AnyStream stream(std::make_unique<CountingSource>(0, true));
  AnyQueryResult result;
  Error err = stream.Drain(&result);
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(result.RowsAffected() == 4);

  AnyItem item;
  REQUIRE(stream.Next(&item) == StreamStatus::kEnd);
}

TEST_CASE("AnyStream: Failed() yields its error first", "[any_value]") {
  AnyStream stream = AnyStream::Failed(Error::Make(ErrorCode::kMisuse, "bad"));
  REQUIRE_FALSE(stream.Done());
  AnyItem item;
  Error err;
  REQUIRE(stream.Next(&item, &err) == StreamStatus::kError);
  REQUIRE(err.code == ErrorCode::kMisuse);
  REQUIRE(stream.Next(&item, &err) == StreamStatus::kEnd);
}

TEST_CASE("AnyConnectOptions: scheme from URL", "[any_value]") {
  AnyConnectOptions opts;
  REQUIRE(AnyConnectOptions::FromUrl("sqlite::memory:", &opts).ok());
  REQUIRE(opts.Scheme() == "sqlite");
  REQUIRE(opts.database_url == "sqlite::memory:");

  Error err = AnyConnectOptions::FromUrl("no-scheme-here", &opts);
  REQUIRE(err.code == ErrorCode::kConfiguration);
  REQUIRE(AnyConnectOptions::FromUrl(nullptr, &opts).code == ErrorCode::kNullParam);
}

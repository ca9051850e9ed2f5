// SPDX-License-Identifier: MIT

// tests/import_mapper_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "src/import_mapper.hpp"

namespace hcat_pipe {
namespace {

using ::testing::_;
using ::testing::Return;

class MockLargeObjectLoader : public ILargeObjectLoader {
public:
    MOCK_METHOD((std::expected<void, Error>), LoadLargeObjects, (SourceRecord&), (override));
    MOCK_METHOD(void, Close, (), (override));
};

// Collects everything the mapper emits.
struct CollectingSink {
    std::vector<std::pair<RecordKey, ConvertedRecord>> records;
    std::vector<Error> errors;
    int completes = 0;

    void OnRecord(RecordKey&& key, ConvertedRecord&& rec) {
        records.emplace_back(std::move(key), std::move(rec));
    }
    void OnError(const Error& e) { errors.push_back(e); }
    void OnComplete() { ++completes; }
    void Invalidate() {}
};

static_assert(RecordSink<CollectingSink>);

// Tees the process logger into a string for the lifetime of the object.
class CapturedLog {
public:
    CapturedLog() : logger_(Logger()), level_(logger_->level()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        sink->set_pattern("%v");
        logger_->sinks().push_back(sink);
    }
    ~CapturedLog() {
        logger_->sinks().pop_back();
        logger_->set_level(level_);
    }

    std::string str() {
        logger_->flush();
        return out_.str();
    }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum level_;
};

TableInfo UsersTable() {
    return TableInfo{
        .database = "default",
        .name = "users",
        .data_columns = {{"id", "bigint"}, {"name", "string"}, {"photo", "binary"},
                         {"bio", "string"}, {"balance", "string"}},
        .partition_columns = {{"country", "string"}},
        .location = "/warehouse/users",
    };
}

TEST(ImportMapperTest, ConvertsAndEmitsWithUnchangedKey) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    SourceRecord record{
        {"ID", int32_t{42}},
        {"Name", std::string("Ann")},
        {"balance", Decimal::FromString("1E+3")},
        {"country", std::string("NZ")},
    };
    ASSERT_TRUE(mapper.Map("row-1", std::move(record)).has_value());

    ASSERT_EQ(sink.records.size(), 1u);
    const auto& [key, out] = sink.records.front();
    EXPECT_EQ(key, "row-1");
    EXPECT_EQ(out.size(), 4u);
    EXPECT_EQ(std::get<int64_t>(out.at("id")), 42);
    EXPECT_EQ(std::get<std::string>(out.at("name")), "Ann");
    EXPECT_EQ(std::get<std::string>(out.at("balance")), "1000");
    EXPECT_EQ(std::get<std::string>(out.at("country")), "NZ");
    EXPECT_EQ(mapper.records(), 1u);
    EXPECT_TRUE(sink.errors.empty());
}

TEST(ImportMapperTest, DecimalFormatFollowsConfiguration) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{.bigdecimal_format_string = false},
                        UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    ASSERT_TRUE(mapper.Map("k", SourceRecord{{"balance", Decimal::FromString("1E+3")}}).has_value());
    EXPECT_EQ(std::get<std::string>(sink.records.at(0).second.at("balance")), "1E+3");
}

TEST(ImportMapperTest, LoaderRunsBeforeConversion) {
    auto loader = std::make_shared<InMemoryLargeObjectLoader>();
    loader->AddFile("_lob/large_obj_0.lob", "PNGDATA and a long biography");

    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), loader, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    SourceRecord record{
        {"photo", BlobRef::External({"_lob/large_obj_0.lob", 0, 7})},
        {"bio", ClobRef::External({"_lob/large_obj_0.lob", 8, 20})},
    };
    ASSERT_TRUE(mapper.Map("k", std::move(record)).has_value());

    const auto& out = sink.records.at(0).second;
    EXPECT_EQ(std::get<ByteVector>(out.at("photo")), ToBytes("PNGDATA"));
    EXPECT_EQ(std::get<std::string>(out.at("bio")), "and a long biography");
}

TEST(ImportMapperTest, UnresolvedLargeObjectsFallBackToReferenceText) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(),
                        std::make_shared<NoOpLargeObjectLoader>(), sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    SourceRecord record{{"photo", BlobRef::External({"big.lob", 100, 4096})}};
    ASSERT_TRUE(mapper.Map("k", std::move(record)).has_value());
    EXPECT_EQ(std::get<ByteVector>(sink.records.at(0).second.at("photo")),
              ToBytes("externalLob(lf,big.lob,100,4096)"));
}

TEST(ImportMapperTest, LoaderFailureSurfacesAsIoError) {
    auto loader = std::make_shared<MockLargeObjectLoader>();
    EXPECT_CALL(*loader, LoadLargeObjects(_))
        .WillOnce(Return(std::expected<void, Error>(std::unexpected(
            Error{ErrorCode::LargeObjectUnavailable, "disk gone"}))));
    EXPECT_CALL(*loader, Close()).Times(1);

    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), loader, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    auto r = mapper.Map("k", SourceRecord{{"id", int64_t{1}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
    EXPECT_NE(r.error().message.find("disk gone"), std::string::npos);
    ASSERT_EQ(sink.errors.size(), 1u);
    EXPECT_EQ(sink.errors[0].code, ErrorCode::IoError);
    EXPECT_TRUE(sink.records.empty());

    mapper.Cleanup();
}

TEST(ImportMapperTest, ConversionFailureAbortsRecord) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    auto r = mapper.Map("k", SourceRecord{{"id", std::string("not a number")}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::UnsupportedMapping);
    EXPECT_TRUE(sink.records.empty());
    EXPECT_EQ(sink.errors.size(), 1u);

    // Mapper keeps going after a failed record
    EXPECT_TRUE(mapper.Map("k2", SourceRecord{{"id", int64_t{2}}}).has_value());
    EXPECT_EQ(sink.records.size(), 1u);
}

TEST(ImportMapperTest, NullPartitionKeyAllowedByDefault) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    EXPECT_TRUE(mapper.Map("k", SourceRecord{{"country", SourceValue{}}}).has_value());
    EXPECT_EQ(sink.records.size(), 1u);
}

TEST(ImportMapperTest, NullPartitionKeyRejectedWhenValidationEnabled) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{.validate_partition_keys = true},
                        UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    auto r = mapper.Map("k", SourceRecord{{"country", SourceValue{}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NullPartitionKey);
    EXPECT_TRUE(sink.records.empty());
}

TEST(ImportMapperTest, MapBeforeSetupIsInvalidState) {
    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), nullptr, sink);

    auto r = mapper.Map("k", SourceRecord{});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}

TEST(ImportMapperTest, SetupReportsSchemaErrors) {
    TableInfo table = UsersTable();
    table.partition_columns.push_back({"ID", "int"});

    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, table, nullptr, sink);
    auto r = mapper.Setup();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::DuplicateField);
    EXPECT_EQ(sink.errors.size(), 1u);
}

TEST(ImportMapperTest, CleanupCompletesOnce) {
    auto loader = std::make_shared<MockLargeObjectLoader>();
    EXPECT_CALL(*loader, Close()).Times(1);

    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), loader, sink);
    ASSERT_TRUE(mapper.Setup().has_value());

    mapper.Cleanup();
    mapper.Cleanup();
    EXPECT_EQ(sink.completes, 1);

    EXPECT_EQ(mapper.Map("k", SourceRecord{}).error().code, ErrorCode::InvalidState);
}

TEST(ImportMapperTest, MappersShareOnePrebuiltSchema) {
    auto schema = TargetSchema::FromTable(UsersTable());
    ASSERT_TRUE(schema.has_value());
    auto shared = std::make_shared<const TargetSchema>(std::move(*schema));

    CollectingSink sink_a;
    CollectingSink sink_b;
    ImportMapper a(ConverterConfig{}, shared, nullptr, sink_a);
    ImportMapper b(ConverterConfig{.bigdecimal_format_string = false}, shared, nullptr, sink_b);
    ASSERT_TRUE(a.Setup().has_value());
    ASSERT_TRUE(b.Setup().has_value());
    EXPECT_EQ(a.schema(), b.schema());

    SourceRecord record{{"balance", Decimal::FromString("1E+3")}};
    ASSERT_TRUE(a.Map("k", record).has_value());
    ASSERT_TRUE(b.Map("k", record).has_value());
    EXPECT_EQ(std::get<std::string>(sink_a.records.at(0).second.at("balance")), "1000");
    EXPECT_EQ(std::get<std::string>(sink_b.records.at(0).second.at("balance")), "1E+3");
}

TEST(ImportMapperTest, DebugPropertyTracesEveryField) {
    CapturedLog log;
    Logger()->set_level(spdlog::level::info);

    auto config = ConverterConfig::FromProperties({{"sqoop.debug.import.mapper", "true"}});
    ASSERT_TRUE(config.has_value());

    CollectingSink sink;
    ImportMapper mapper(*config, UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());
    ASSERT_TRUE(mapper.Map("k", SourceRecord{{"Id", int32_t{1}}}).has_value());

    std::string text = log.str();
    EXPECT_NE(text.find("field = Id"), std::string::npos) << text;
    EXPECT_NE(text.find("of type int32"), std::string::npos) << text;
    EXPECT_NE(text.find("hcattype bigint"), std::string::npos) << text;
}

TEST(ImportMapperTest, NoFieldTraceByDefault) {
    CapturedLog log;
    Logger()->set_level(spdlog::level::info);

    CollectingSink sink;
    ImportMapper mapper(ConverterConfig{}, UsersTable(), nullptr, sink);
    ASSERT_TRUE(mapper.Setup().has_value());
    ASSERT_TRUE(mapper.Map("k", SourceRecord{{"Id", int32_t{1}}}).has_value());

    EXPECT_EQ(log.str().find("field = "), std::string::npos);
}

TEST(ImportMapperTest, ReadyMessageNamesTableWhenKnown) {
    CapturedLog log;
    Logger()->set_level(spdlog::level::info);

    CollectingSink sink;
    ImportMapper from_table(ConverterConfig{}, UsersTable(), nullptr, sink);
    ASSERT_TRUE(from_table.Setup().has_value());
    EXPECT_NE(log.str().find("ready for default.users at '/warehouse/users': 6 fields (1 partition)"),
              std::string::npos) << log.str();

    auto schema = TargetSchema::FromTable(UsersTable());
    ASSERT_TRUE(schema.has_value());
    ImportMapper prebuilt(ConverterConfig{},
                          std::make_shared<const TargetSchema>(std::move(*schema)),
                          nullptr, sink);
    ASSERT_TRUE(prebuilt.Setup().has_value());
    std::string text = log.str();
    EXPECT_NE(text.find("Import mapper ready: 6 fields (1 partition)"), std::string::npos) << text;
    EXPECT_EQ(text.find("ready for ."), std::string::npos) << text;
}

}  // namespace
}  // namespace hcat_pipe

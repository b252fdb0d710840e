#include <duckdb.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <vector>

#include "storage/controller/library/library_controller.hpp"
#include "storage/library_repository.hpp"
#include "utils/clock/time_provider.hpp"

namespace momento {
class LibraryRepositoryTests : public ::testing::Test {
 protected:
  std::filesystem::path db_path_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    db_path_ = std::filesystem::temp_directory_path() / "momento_library_repository_test.duckdb";
    RemoveDb();
  }

  void TearDown() override { RemoveDb(); }

  void RemoveDb() {
    std::filesystem::remove(db_path_);
    std::filesystem::path wal = db_path_;
    wal += ".wal";
    std::filesystem::remove(wal);
  }

  static auto MakeAsset(const std::string& hash, const std::string& name) -> MediaAsset {
    MediaAsset asset;
    asset.content_hash_      = hash;
    asset.filename_          = name;
    asset.original_filename_ = name;
    asset.file_path_         = "originals/2024-05/" + name;
    asset.thumbnail_path_    = "thumbnails/2024-05/" + name;
    asset.media_type_        = MediaKind::IMAGE;
    asset.mime_type_         = "image/jpeg";
    asset.file_size_         = 1024;
    asset.created_at_        = TimeProvider::NowIso8601();
    return asset;
  }

  static auto Hash(int n) -> std::string {
    std::string hex = std::to_string(n);
    return std::string(32 - hex.size(), '0') + hex;
  }
};

TEST_F(LibraryRepositoryTests, InsertAndFindRoundTripsColumns) {
  LibraryController repo(db_path_);
  auto              asset          = MakeAsset(Hash(1), "a.jpg");
  asset.metadata_.width_           = 4000;
  asset.metadata_.height_          = 3000;
  asset.metadata_.date_taken_      = "2024-05-12T10:15:00";
  asset.metadata_.gps_latitude_    = 40.7128;
  asset.metadata_.gps_longitude_   = -74.006;
  asset.metadata_.geohash_         = "dr5regw";
  asset.metadata_.camera_make_     = "Canon";
  asset.metadata_.exposure_time_   = "1/250";
  asset.metadata_.iso_             = 200;
  asset.metadata_.keywords_        = "sunset,beach";

  media_id_t id                    = repo.Insert(asset);
  EXPECT_GT(id, 0);

  auto by_hash = repo.FindByHash(Hash(1));
  ASSERT_TRUE(by_hash.has_value());
  EXPECT_EQ(by_hash->id_, id);
  EXPECT_EQ(by_hash->file_path_, "originals/2024-05/a.jpg");
  EXPECT_EQ(by_hash->thumbnail_path_, "thumbnails/2024-05/a.jpg");
  EXPECT_FALSE(by_hash->preview_path_.has_value());
  EXPECT_EQ(by_hash->media_type_, MediaKind::IMAGE);
  EXPECT_EQ(by_hash->metadata_, asset.metadata_);
  EXPECT_FALSE(by_hash->IsTrashed());

  auto by_id = repo.FindById(id);
  ASSERT_TRUE(by_id.has_value());
  EXPECT_EQ(by_id->content_hash_, Hash(1));

  EXPECT_FALSE(repo.FindByHash(Hash(2)).has_value());
  EXPECT_FALSE(repo.FindById(id + 100).has_value());

  EXPECT_EQ(repo.GetTags(id), (std::vector<std::string>{"beach", "sunset"}));
}

TEST_F(LibraryRepositoryTests, DuplicateHashIsRejectedAndNothingIsWritten) {
  LibraryController repo(db_path_);
  repo.Insert(MakeAsset(Hash(7), "first.jpg"));
  auto second = MakeAsset(Hash(7), "second.jpg");
  second.metadata_.keywords_ = "should-not-exist";
  try {
    repo.Insert(second);
    FAIL() << "expected DuplicateHashError";
  } catch (const DuplicateHashError& e) {
    EXPECT_EQ(e.Hash(), Hash(7));
  }
  EXPECT_EQ(repo.Count(), 1);
  EXPECT_EQ(repo.FindByHash(Hash(7))->filename_, "first.jpg");
}

TEST_F(LibraryRepositoryTests, UpdateAppliesOnlySetFieldsAndCountsNewTagLinks) {
  LibraryController repo(db_path_);
  auto              asset   = MakeAsset(Hash(3), "c.jpg");
  asset.metadata_.keywords_ = "beach";
  media_id_t id             = repo.Insert(asset);

  MediaPatch paths;
  paths.preview_path_ = "previews/2024-05/c.jpg";
  EXPECT_EQ(repo.Update(id, paths), 0u);
  auto after_paths = repo.FindById(id);
  EXPECT_EQ(after_paths->preview_path_, "previews/2024-05/c.jpg");
  EXPECT_EQ(after_paths->thumbnail_path_, "thumbnails/2024-05/c.jpg");
  EXPECT_EQ(after_paths->metadata_.keywords_, "beach");

  MediaPatch meta;
  meta.metadata_                = MetadataRecord{};
  meta.metadata_->keywords_     = "beach,family";
  meta.metadata_->camera_model_ = "X100V";
  EXPECT_EQ(repo.Update(id, meta), 1u);
  EXPECT_EQ(repo.Update(id, meta), 0u);
  EXPECT_EQ(repo.FindById(id)->metadata_.camera_model_, "X100V");
  EXPECT_EQ(repo.GetTags(id), (std::vector<std::string>{"beach", "family"}));
}

TEST_F(LibraryRepositoryTests, UpdateFailures) {
  LibraryController repo(db_path_);
  media_id_t        a = repo.Insert(MakeAsset(Hash(10), "a.jpg"));
  repo.Insert(MakeAsset(Hash(11), "b.jpg"));

  MediaPatch missing;
  missing.thumbnail_path_ = "thumbnails/x.jpg";
  EXPECT_THROW(repo.Update(a + 1000, missing), StorageIntegrityError);

  MediaPatch clash;
  clash.content_hash_ = Hash(11);
  EXPECT_THROW(repo.Update(a, clash), DuplicateHashError);
  EXPECT_EQ(repo.FindById(a)->content_hash_, Hash(10));
}

TEST_F(LibraryRepositoryTests, NonHashConstraintFailureIsAnIntegrityError) {
  { LibraryController schema(db_path_); }

  // Take the id the sequence will hand out next, so Insert fails on the primary key
  duckdb_database   db  = nullptr;
  duckdb_connection con = nullptr;
  ASSERT_EQ(duckdb_open(db_path_.string().c_str(), &db), DuckDBSuccess);
  ASSERT_EQ(duckdb_connect(db, &con), DuckDBSuccess);
  ASSERT_EQ(duckdb_query(con,
                         "INSERT INTO media (id, content_hash, filename, original_filename, "
                         "file_path, media_type, file_size, created_at) VALUES (1, "
                         "'seeded', 's.jpg', 's.jpg', 'originals/s.jpg', 'image', 1, "
                         "'2024-05-12T10:15:00Z')",
                         nullptr),
            DuckDBSuccess);
  duckdb_disconnect(&con);
  duckdb_close(&db);

  LibraryController repo(db_path_);
  EXPECT_THROW(repo.Insert(MakeAsset(Hash(20), "fresh.jpg")), StorageIntegrityError);
  EXPECT_FALSE(repo.FindByHash(Hash(20)).has_value());
  EXPECT_EQ(repo.Count(), 1);
}

TEST_F(LibraryRepositoryTests, CursorWalksEveryRowInIdOrderAcrossPages) {
  LibraryController       repo(db_path_);
  std::vector<media_id_t> inserted;
  for (int i = 0; i < 7; ++i) {
    inserted.push_back(repo.Insert(MakeAsset(Hash(100 + i), std::to_string(i) + ".jpg")));
  }
  EXPECT_EQ(repo.Count(), 7);

  auto                    cursor = repo.ListAll(3);
  std::vector<media_id_t> seen;
  while (auto asset = cursor->Next()) {
    seen.push_back(asset->id_);
  }
  EXPECT_EQ(seen, inserted);
  EXPECT_FALSE(cursor->Next().has_value());
}

TEST_F(LibraryRepositoryTests, TrashRestoreAndPurge) {
  LibraryController repo(db_path_);
  auto              asset   = MakeAsset(Hash(20), "t.jpg");
  asset.metadata_.keywords_ = "gone";
  media_id_t id             = repo.Insert(asset);

  repo.MoveToTrash(id);
  auto trashed = repo.FindById(id);
  ASSERT_TRUE(trashed.has_value());
  EXPECT_TRUE(trashed->IsTrashed());
  EXPECT_TRUE(repo.FindByHash(Hash(20)).has_value());

  repo.Restore(id);
  EXPECT_FALSE(repo.FindById(id)->IsTrashed());

  repo.Purge(id);
  EXPECT_FALSE(repo.FindById(id).has_value());
  EXPECT_TRUE(repo.GetTags(id).empty());
  EXPECT_EQ(repo.Count(), 0);
  EXPECT_THROW(repo.Purge(id), StorageIntegrityError);
  EXPECT_THROW(repo.MoveToTrash(id), StorageIntegrityError);
}

TEST_F(LibraryRepositoryTests, ClearDerivedDataKeepsIdentity) {
  LibraryController repo(db_path_);
  auto              asset      = MakeAsset(Hash(30), "d.jpg");
  asset.preview_path_          = "previews/2024-05/d.jpg";
  asset.metadata_.camera_make_ = "Sony";
  asset.metadata_.width_       = 10;
  asset.metadata_.height_      = 20;
  media_id_t first             = repo.Insert(asset);
  media_id_t second            = repo.Insert(MakeAsset(Hash(31), "e.jpg"));

  repo.ClearDerivedData(first);
  auto cleared = repo.FindById(first);
  EXPECT_FALSE(cleared->thumbnail_path_.has_value());
  EXPECT_FALSE(cleared->preview_path_.has_value());
  EXPECT_EQ(cleared->metadata_, MetadataRecord{});
  EXPECT_EQ(cleared->content_hash_, Hash(30));
  EXPECT_EQ(cleared->file_path_, "originals/2024-05/d.jpg");
  EXPECT_TRUE(repo.FindById(second)->thumbnail_path_.has_value());

  repo.ClearAllDerivedData();
  EXPECT_FALSE(repo.FindById(second)->thumbnail_path_.has_value());
  EXPECT_EQ(repo.Count(), 2);
}

TEST_F(LibraryRepositoryTests, JobStatusUpsertAndReload) {
  {
    LibraryController repo(db_path_);
    EXPECT_FALSE(repo.LoadJobStatus("import").has_value());
    repo.SaveJobStatus("import", {{"status", "running"}, {"processedFiles", 1}});
    repo.SaveJobStatus("import", {{"status", "completed"}, {"processedFiles", 4}});
    repo.SaveJobStatus("regeneration", {{"status", "idle"}});
    repo.Insert(MakeAsset(Hash(40), "p.jpg"));
  }
  LibraryController reopened(db_path_);
  auto              import_status = reopened.LoadJobStatus("import");
  ASSERT_TRUE(import_status.has_value());
  EXPECT_EQ((*import_status)["status"], "completed");
  EXPECT_EQ((*import_status)["processedFiles"], 4);
  EXPECT_EQ((*reopened.LoadJobStatus("regeneration"))["status"], "idle");
  EXPECT_TRUE(reopened.FindByHash(Hash(40)).has_value());
}
};  // namespace momento

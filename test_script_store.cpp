#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "db/db.h"
#include "execution/script_validator.h"
#include "scripts/script_store.h"

using namespace scripthub;
using namespace scripthub::scripts;
namespace fs = std::filesystem;

static fs::path g_root;

static const char* kValid = "def main(data: dict) -> dict:\n    return {'ok': True}\n";
static const char* kValid2 = "def main(data: dict) -> dict:\n    return {'version': 2}\n";

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

template <typename Fn>
static ErrorCode expect_error(Fn fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.code();
    }
    assert(false && "expected StoreError");
    return ErrorCode::ValidationError;
}

static NewScript new_script(const std::string& filename, std::optional<std::int64_t> folder = std::nullopt,
                            const std::string& content = kValid) {
    NewScript ns;
    ns.filename = filename;
    ns.displayName = filename;
    ns.description = "test script";
    ns.folderId = folder;
    ns.content = content;
    return ns;
}

static void test_folders(ScriptStore& store) {
    auto geo = store.createFolder("geology", std::nullopt);
    assert(geo.id > 0);
    assert(geo.path == "geology");
    assert(!geo.parentId);

    auto sub = store.createFolder("wells", geo.id);
    assert(sub.path == "geology/wells");
    assert(sub.parentId && *sub.parentId == geo.id);

    assert(expect_error([&] { store.createFolder("geology", std::nullopt); }) == ErrorCode::FolderAlreadyExists);
    assert(expect_error([&] { store.createFolder("x", 9999); }) == ErrorCode::ParentFolderNotFound);
    assert(expect_error([&] { store.createFolder("a/b", std::nullopt); }) == ErrorCode::InvalidFolderName);
    assert(expect_error([&] { store.createFolder("..", std::nullopt); }) == ErrorCode::InvalidFolderName);
    assert(expect_error([&] { store.createFolder("", std::nullopt); }) == ErrorCode::InvalidFolderName);

    assert(store.getFolder(sub.id)->path == "geology/wells");
    std::cout << "[OK] folders\n";
}

static void test_create_and_resolve(ScriptStore& store) {
    auto geo = store.createFolder("survey", std::nullopt);
    auto s = store.createScript(new_script("test.py", geo.id));
    assert(s.id > 0);
    assert(s.logicalPath == "survey/test.py");
    assert(s.storageFilename == "test.py");
    assert(read_file(g_root / "scripts" / "test.py") == kValid);

    auto r = store.resolve("survey/test.py");
    assert(r);
    assert(r->logicalPath == "survey/test.py");
    assert(r->sourceText == kValid);
    assert(fs::equivalent(r->storageLocation, g_root / "scripts" / "test.py"));

    // 前导 '/' 忽略
    assert(store.resolve("/survey/test.py"));
    assert(!store.resolve("survey/other.py"));
    assert(!store.resolve("../test.py"));
    assert(!store.resolve(""));

    assert(store.findByLogicalPath("survey/test.py")->id == s.id);
    assert(store.getScriptContent(s.id) == kValid);
    std::cout << "[OK] create + resolve\n";
}

static void test_storage_name_collision(ScriptStore& store) {
    // 根目录下的 test.py 已经被 survey/test.py 占用
    auto root = store.createScript(new_script("test.py"));
    assert(root.logicalPath == "test.py");
    assert(root.storageFilename == "test_1.py");

    auto other = store.createFolder("other", std::nullopt);
    auto third = store.createScript(new_script("test.py", other.id));
    assert(third.storageFilename == "test_2.py");
    assert(fs::exists(g_root / "scripts" / "test_2.py"));
    std::cout << "[OK] storage collision -> " << root.storageFilename << ", "
              << third.storageFilename << "\n";
}

static void test_replace(ScriptStore& store) {
    auto s = store.createScript(new_script("replace_me.py"));

    assert(expect_error([&] { store.createScript(new_script("replace_me.py")); })
           == ErrorCode::ScriptExistsReplaceRequired);

    NewScript ns = new_script("replace_me.py", std::nullopt, kValid2);
    ns.replace = true;
    ns.displayName = "Replaced";
    auto replaced = store.createScript(ns);
    assert(replaced.id == s.id);
    assert(replaced.storageFilename == s.storageFilename);
    assert(replaced.displayName == "Replaced");
    assert(store.getScriptContent(s.id) == kValid2);
    std::cout << "[OK] replace keeps id and storage file\n";
}

static void test_validation(ScriptStore& store) {
    assert(expect_error([&] { store.createScript(new_script("bad.txt")); }) == ErrorCode::InvalidFilename);
    assert(expect_error([&] { store.createScript(new_script("a/b.py")); }) == ErrorCode::InvalidFilename);
    assert(expect_error([&] { store.createScript(new_script(".py")); }) == ErrorCode::InvalidFilename);
    assert(expect_error([&] {
        store.createScript(new_script("nomain.py", std::nullopt, "x = 1\n"));
    }) == ErrorCode::ScriptMissingMain);
    assert(expect_error([&] {
        store.createScript(new_script("typed.py", std::nullopt, "def main(data: list):\n    return {}\n"));
    }) == ErrorCode::ScriptMissingMain);
    assert(expect_error([&] {
        store.createScript(new_script("syntax.py", std::nullopt, "def main(data: dict)\n"));
    }) == ErrorCode::InvalidScriptContent);
    assert(expect_error([&] { store.createScript(new_script("orphan.py", 424242)); })
           == ErrorCode::FolderNotFound);

    try {
        store.createScript(new_script("nomain2.py", std::nullopt, "x = 1\n"));
    } catch (const StoreError& e) {
        assert(std::string(e.what()).find("main") != std::string::npos);
        assert(ErrorCodeToHttpStatus(e.code()) == 400);
    }
    assert(!fs::exists(g_root / "scripts" / "nomain.py"));
    std::cout << "[OK] filename and content validation\n";
}

static void test_update(ScriptStore& store) {
    auto f = store.createFolder("ops", std::nullopt);
    auto a = store.createScript(new_script("a.py", f.id));
    auto b = store.createScript(new_script("b.py", f.id));

    ScriptPatch meta;
    meta.displayName = "Alpha";
    meta.description = "first";
    auto a2 = store.updateScript(a.id, meta);
    assert(a2.displayName == "Alpha");
    assert(a2.description == "first");
    assert(a2.logicalPath == "ops/a.py");

    ScriptPatch rename;
    rename.filename = "b.py";
    assert(expect_error([&] { store.updateScript(a.id, rename); }) == ErrorCode::ScriptAlreadyExists);

    rename.filename = "renamed.py";
    auto a3 = store.updateScript(a.id, rename);
    assert(a3.logicalPath == "ops/renamed.py");
    assert(a3.displayName == "Alpha");
    assert(a3.storageFilename == a.storageFilename);
    assert(store.resolve("ops/renamed.py"));
    assert(!store.resolve("ops/a.py"));

    auto b2 = store.updateScriptContent(b.id, kValid2);
    assert(b2.id == b.id);
    assert(store.getScriptContent(b.id) == kValid2);
    assert(expect_error([&] { store.updateScriptContent(b.id, "def nope(): pass\n"); })
           == ErrorCode::ScriptMissingMain);
    assert(store.getScriptContent(b.id) == kValid2);

    assert(expect_error([&] { store.updateScript(999999, meta); }) == ErrorCode::ScriptNotFound);
    std::cout << "[OK] update metadata / rename / content\n";
}

static void test_rename_folder(ScriptStore& store) {
    auto lab = store.createFolder("lab", std::nullopt);
    auto deep = store.createFolder("deep", lab.id);
    auto lab2 = store.createFolder("lab2", std::nullopt);
    auto x = store.createScript(new_script("lab_x.py", lab.id));
    auto y = store.createScript(new_script("lab_y.py", deep.id));
    auto z = store.createScript(new_script("lab_z.py", lab2.id));

    auto renamed = store.renameFolder(lab.id, "research");
    assert(renamed.id == lab.id);
    assert(renamed.name == "research");
    assert(renamed.path == "research");
    assert(store.getFolder(deep.id)->path == "research/deep");
    assert(store.getFolder(deep.id)->name == "deep");

    assert(store.getScript(x.id)->logicalPath == "research/lab_x.py");
    assert(store.getScript(y.id)->logicalPath == "research/deep/lab_y.py");
    assert(store.getScript(x.id)->storageFilename == x.storageFilename);

    // 新路径可以解析，旧路径失效；"lab2" 虽然前缀相同但不在子树里
    auto r = store.resolve("research/deep/lab_y.py");
    assert(r);
    assert(r->sourceText == kValid);
    assert(!store.resolve("lab/lab_x.py"));
    assert(!store.resolve("lab/deep/lab_y.py"));
    assert(store.getFolder(lab2.id)->path == "lab2");
    assert(store.getScript(z.id)->logicalPath == "lab2/lab_z.py");
    assert(store.resolve("lab2/lab_z.py"));

    // 同名改名不变
    assert(store.renameFolder(lab.id, "research").path == "research");

    assert(expect_error([&] { store.renameFolder(lab.id, "lab2"); }) == ErrorCode::FolderAlreadyExists);
    assert(expect_error([&] { store.renameFolder(lab.id, "a/b"); }) == ErrorCode::InvalidFolderName);
    assert(expect_error([&] { store.renameFolder(987654, "new"); }) == ErrorCode::FolderNotFound);
    assert(store.getFolder(lab.id)->path == "research");

    // 子文件夹改名只影响自己的子树
    auto deep2 = store.renameFolder(deep.id, "deeper");
    assert(deep2.path == "research/deeper");
    assert(store.getScript(y.id)->logicalPath == "research/deeper/lab_y.py");
    assert(store.getScript(x.id)->logicalPath == "research/lab_x.py");
    std::cout << "[OK] rename folder rewrites subtree paths\n";
}

static void test_symlink_outside_root_rejected(ScriptStore& store) {
    const fs::path outside = g_root / "outside.py";
    std::ofstream(outside, std::ios::binary) << kValid;

    auto s = store.createScript(new_script("linked.py"));
    const fs::path stored = g_root / "scripts" / s.storageFilename;
    assert(store.resolve("linked.py"));

    fs::remove(stored);
    fs::create_symlink(outside, stored);
    assert(!store.resolve("linked.py"));

    fs::remove(stored);
    std::ofstream(stored, std::ios::binary) << kValid;
    assert(store.resolve("linked.py"));
    std::cout << "[OK] symlink escaping scripts root rejected\n";
}

static void test_delete(ScriptStore& store) {
    auto s = store.createScript(new_script("doomed.py"));
    const fs::path file = g_root / "scripts" / s.storageFilename;
    assert(fs::exists(file));
    store.deleteScript(s.id);
    assert(!fs::exists(file));
    assert(!store.getScript(s.id));
    assert(expect_error([&] { store.deleteScript(s.id); }) == ErrorCode::ScriptNotFound);

    // 递归删除文件夹
    auto top = store.createFolder("tmpdir", std::nullopt);
    auto mid = store.createFolder("mid", top.id);
    auto leaf = store.createFolder("leaf", mid.id);
    auto s1 = store.createScript(new_script("one.py", top.id));
    auto s2 = store.createScript(new_script("two.py", leaf.id));
    store.deleteFolder(top.id);

    assert(!store.getFolder(top.id));
    assert(!store.getFolder(mid.id));
    assert(!store.getFolder(leaf.id));
    assert(!store.getScript(s1.id));
    assert(!store.getScript(s2.id));
    assert(!fs::exists(g_root / "scripts" / s1.storageFilename));
    assert(!fs::exists(g_root / "scripts" / s2.storageFilename));
    assert(expect_error([&] { store.deleteFolder(top.id); }) == ErrorCode::FolderNotFound);
    std::cout << "[OK] delete script / folder subtree\n";
}

static void test_tree(ScriptStore& store) {
    json t = store.tree();
    assert(t["root_folders"].is_array());
    assert(t["root_scripts"].is_array());

    bool foundGeology = false;
    for (const auto& item : t["root_folders"]) {
        if (item["folder"]["path"] == "geology") {
            foundGeology = true;
            assert(item["subfolders"].size() == 1);
            assert(item["subfolders"][0]["folder"]["path"] == "geology/wells");
        }
        assert(item["folder"]["parent_id"].is_null());
    }
    assert(foundGeology);

    bool foundRootTest = false;
    for (const auto& s : t["root_scripts"]) {
        assert(s["folder_id"].is_null());
        if (s["logical_path"] == "test.py") foundRootTest = true;
    }
    assert(foundRootTest);
    std::cout << "[OK] tree\n";
}

static void test_persistence() {
    const fs::path dbPath = g_root / "store.db";
    {
        Db db;
        assert(db.open(dbPath.string()));
        ScriptStore store(db, g_root / "scripts2");
        assert(store.ensureSchema());
        store.createScript(new_script("kept.py"));
    }
    Db db;
    assert(db.open(dbPath.string()));
    ScriptStore store(db, g_root / "scripts2");
    assert(store.ensureSchema());
    auto r = store.resolve("kept.py");
    assert(r);
    assert(r->sourceText == kValid);
    std::cout << "[OK] reopen database\n";
}

int main() {
    std::string err;
    if (!exec::ScriptValidator::warmUp(err)) {
        std::cout << "[SKIP] embedded python unavailable: " << err << "\n";
        return 0;
    }

    g_root = fs::temp_directory_path() / ("store_test_" + std::to_string(::getpid()));
    fs::remove_all(g_root);
    fs::create_directories(g_root / "scripts");

    Db db;
    assert(db.open(":memory:"));
    ScriptStore store(db, g_root / "scripts");
    assert(store.ensureSchema());

    test_folders(store);
    test_create_and_resolve(store);
    test_storage_name_collision(store);
    test_replace(store);
    test_validation(store);
    test_update(store);
    test_rename_folder(store);
    test_symlink_outside_root_rejected(store);
    test_delete(store);
    test_tree(store);
    test_persistence();

    fs::remove_all(g_root);
    std::cout << "\nALL script store tests passed\n";
    return 0;
}

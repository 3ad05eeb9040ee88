#include "test_support.h"
#include "runner/script_stager.h"

using namespace autorun;
using namespace autorun::runner;

namespace {

core::StagedScript staged(const fs::path& p) {
    return core::StagedScript{"/src/" + p.filename().string(), p.string(), p.filename().string()};
}

} // namespace

static void test_classify() {
    const fs::path root = make_temp_dir("stager_classify");
    write_script(root / "elf", std::string("\x7f" "ELF\x02\x01\x01", 7));
    write_script(root / "sh", "#!/bin/sh\n");
    write_script(root / "tiny", "ab");

    assert(ScriptStager::classify((root / "elf").string()) == ScriptKind::Binary);
    assert(ScriptStager::classify((root / "sh").string()) == ScriptKind::Text);
    assert(ScriptStager::classify((root / "tiny").string()) == ScriptKind::Text);
    assert(ScriptStager::classify((root / "missing").string()) == ScriptKind::Text);

    fs::remove_all(root);
    std::cout << "[stager] classify OK\n";
}

static void test_crlf_converted() {
    auto sink = install_capture_sink();
    const fs::path root = make_temp_dir("stager_crlf");
    write_script(root / "autorun1", "#!/bin/sh\r\necho a\r\necho b\r\n");

    ScriptStager stager;
    stager.normalize(staged(root / "autorun1"));

    assert(slurp(root / "autorun1") == "#!/bin/sh\necho a\necho b\n");
    // 一个文件只警告一次，不是每行一次
    assert(sink->count(LogLevel::Warn, "autorun1", "Windows line endings") == 1);
    assert(sink->count(LogLevel::Warn, "autorun1", "shebang") == 0);

    fs::remove_all(root);
    std::cout << "[stager] CRLF converted OK\n";
}

static void test_shebang_added() {
    auto sink = install_capture_sink();
    const fs::path root = make_temp_dir("stager_shebang");
    write_script(root / "autorun", "echo hello\n");
    write_script(root / "autorun2", "echo x\r\n");

    ScriptStager stager;
    stager.normalizeAll({staged(root / "autorun"), staged(root / "autorun2")});

    assert(slurp(root / "autorun") == "#!/bin/sh\necho hello\n");
    assert(sink->count(LogLevel::Warn, "autorun", "no shebang") == 1);

    // 两种问题同时存在：各警告一次
    assert(slurp(root / "autorun2") == "#!/bin/sh\necho x\n");
    assert(sink->count(LogLevel::Warn, "autorun2", "no shebang") == 1);
    assert(sink->count(LogLevel::Warn, "autorun2", "Windows line endings") == 1);

    fs::remove_all(root);
    std::cout << "[stager] shebang added OK\n";
}

static void test_untouched_cases() {
    auto sink = install_capture_sink();
    const fs::path root = make_temp_dir("stager_untouched");
    const std::string elf = std::string("\x7f" "ELF\r\n\x00\x01", 8);
    write_script(root / "autorun3", elf);
    write_script(root / "autorun4", "#!/bin/bash\necho ok\n");

    ScriptStager stager;
    stager.normalize(staged(root / "autorun3"));
    stager.normalize(staged(root / "autorun4"));

    assert(slurp(root / "autorun3") == elf);
    assert(slurp(root / "autorun4") == "#!/bin/bash\necho ok\n");
    assert(sink->count(LogLevel::Warn, "autorun3", "") == 0);
    assert(sink->count(LogLevel::Warn, "autorun4", "") == 0);

    // 文件不存在：只记日志，不抛
    stager.normalize(staged(root / "autorun9"));
    assert(sink->count(LogLevel::Warn, "autorun9", "Cannot read") == 1);

    fs::remove_all(root);
    std::cout << "[stager] untouched cases OK\n";
}

int main() {
    test_classify();
    test_crlf_converted();
    test_shebang_added();
    test_untouched_cases();
    std::cout << "ALL script stager tests passed\n";
    return 0;
}

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "execution/script_validator.h"

using namespace scripthub::exec;

static void expect(const std::string& source, ValidationCode code) {
    auto v = ScriptValidator::validate(source);
    if (v.code != code) {
        std::cerr << "unexpected verdict " << ValidationCodeToString(v.code)
                  << " (want " << ValidationCodeToString(code) << ") for:\n"
                  << source << "\nmessage: " << v.message << "\n";
    }
    assert(v.code == code);
    assert(v.valid == (code == ValidationCode::Ok));
    if (!v.valid) assert(!v.message.empty());
}

static void test_accepts_dict_entry_point() {
    expect("def main(data: dict) -> dict:\n    return data\n", ValidationCode::Ok);
    expect("from typing import Dict, Any\n\n"
           "def main(data: Dict[str, Any]) -> Dict[str, Any]:\n    return {}\n",
           ValidationCode::Ok);
    expect("import typing\n\ndef main(data: typing.Dict):\n    return {}\n", ValidationCode::Ok);
    expect("def main(data: dict[str, int]):\n    return None\n", ValidationCode::Ok);
    expect("def main(data: \"dict\"):\n    return {}\n", ValidationCode::Ok);
    // 没有注解也放行
    expect("def main(data):\n    return {}\n", ValidationCode::Ok);
    std::cout << "[OK] dict-typed main accepted\n";
}

static void test_rejects_missing_entry_point() {
    expect("def helper(data: dict):\n    return data\n", ValidationCode::MissingEntryPoint);
    expect("main = lambda data: data\n", ValidationCode::MissingEntryPoint);
    expect("", ValidationCode::MissingEntryPoint);

    auto v = ScriptValidator::validate("x = 1\n");
    assert(v.message.find("main") != std::string::npos);
    std::cout << "[OK] missing main: " << v.message << "\n";
}

static void test_rejects_bad_signature() {
    expect("def main():\n    return {}\n", ValidationCode::BadSignature);
    expect("def main(a: dict, b: dict):\n    return {}\n", ValidationCode::BadSignature);
    expect("def main(*args):\n    return {}\n", ValidationCode::BadSignature);
    expect("def main(data: dict, *, flag=True):\n    return {}\n", ValidationCode::BadSignature);
    expect("def main(data: dict, **kw):\n    return {}\n", ValidationCode::BadSignature);
    std::cout << "[OK] bad signatures rejected\n";
}

static void test_rejects_bad_parameter_type() {
    expect("def main(data: list):\n    return {}\n", ValidationCode::BadParameterType);
    expect("def main(data: str):\n    return {}\n", ValidationCode::BadParameterType);
    expect("from typing import List\n\ndef main(data: List[int]):\n    return {}\n",
           ValidationCode::BadParameterType);
    std::cout << "[OK] non-dict parameter rejected\n";
}

static void test_reports_syntax_errors() {
    auto v = ScriptValidator::validate("def main(data: dict)\n    return data\n");
    assert(!v.valid);
    assert(v.code == ValidationCode::SyntaxInvalid);
    assert(v.message.find("invalid Python syntax") == 0);
    assert(v.message.find("line 1") != std::string::npos);
    std::cout << "[OK] syntax error:\n" << v.message << "\n";

    expect("def main(data: dict):\nreturn data\n", ValidationCode::SyntaxInvalid);
    expect(std::string("def main(data: dict):\n    return {}\n\xff\xfe"),
           ValidationCode::SyntaxInvalid);
}

static void test_does_not_execute_source() {
    // 模块级代码只被解析，不会运行
    expect("import os\nos._exit(3)\n\ndef main(data: dict):\n    return {}\n",
           ValidationCode::Ok);
    expect("raise SystemExit(1)\n\ndef main(data: dict):\n    return {}\n",
           ValidationCode::Ok);
    std::cout << "[OK] module-level code not executed\n";
}

static void test_nested_and_async_definitions() {
    // 嵌套定义也算找到 main
    expect("class Runner:\n    def main(self, data: dict):\n        return {}\n",
           ValidationCode::BadSignature);
    // async def 不是 FunctionDef
    expect("async def main(data: dict):\n    return {}\n", ValidationCode::MissingEntryPoint);
    std::cout << "[OK] nested / async definitions\n";
}

static void test_concurrent_validation() {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([i] {
            for (int k = 0; k < 20; ++k) {
                auto v = ScriptValidator::validate(
                    (i % 2 == 0) ? "def main(data: dict):\n    return {}\n"
                                 : "def main(data: list):\n    return {}\n");
                assert(v.code == ((i % 2 == 0) ? ValidationCode::Ok
                                               : ValidationCode::BadParameterType));
            }
        });
    }
    for (auto& t : threads) t.join();
    std::cout << "[OK] concurrent validation\n";
}

int main() {
    test_accepts_dict_entry_point();
    test_rejects_missing_entry_point();
    test_rejects_bad_signature();
    test_rejects_bad_parameter_type();
    test_reports_syntax_errors();
    test_does_not_execute_source();
    test_nested_and_async_definitions();
    test_concurrent_validation();
    std::cout << "\nALL validator tests passed\n";
    return 0;
}

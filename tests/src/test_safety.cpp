#include "dmk/directives.h"
#include "dmk/errors.h"
#include "dmk/exec_wrapper.h"
#include "dmk/log.h"
#include "dmk/safety_gate.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool contains(const std::vector<std::string>& items, const std::string& item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", std::filesystem::current_path());

  int failures = 0;

  // Test: bare JSON is a modality mismatch, not a parse error.
  {
    bool threw = false;
    try {
      dmk::classify_payload("{\"a\":1}");
    } catch (const dmk::MacroError& e) {
      threw = true;
      if (e.kind() != dmk::ErrorKind::SyntaxDefect || e.code() != "modality_mismatch") {
        std::cerr << "bare JSON object must raise SyntaxDefect/modality_mismatch, got " << e.display() << "\n";
        ++failures;
      }
      if (e.display().rfind("SyntaxDefect: ", 0) != 0) {
        std::cerr << "error display must start with the kind: " << e.display() << "\n";
        ++failures;
      }
    }
    if (!threw) {
      std::cerr << "bare JSON object was accepted as script\n";
      ++failures;
    }
    bool array_threw = false;
    try {
      dmk::classify_payload("  [1, 2, 3]\n");
    } catch (const dmk::MacroError& e) {
      array_threw = e.code() == "modality_mismatch";
    }
    if (!array_threw) {
      std::cerr << "bare JSON array must be a modality mismatch\n";
      ++failures;
    }
  }

  // Test: plans, envelopes and scripts.
  {
    const auto plan = dmk::classify_payload(
        "Here is the plan:\n```json\n{\"schema_version\":\"dmk.plan.v1\",\"operations\":[]}\n```");
    if (plan.kind != dmk::PayloadKind::Plan || plan.plan.value("schema_version", "") != "dmk.plan.v1") {
      std::cerr << "plan wrapped in prose not recognized\n";
      ++failures;
    }
    const auto envelope = dmk::classify_payload("{\"code\": \"  var a = 1;  \"}");
    if (envelope.kind != dmk::PayloadKind::WrappedScript || envelope.script != "var a = 1;") {
      std::cerr << "script envelope not unwrapped: " << envelope.script << "\n";
      ++failures;
    }
    const auto nested = dmk::classify_payload("{\"payload\": {\"js\": \"f()\"}}");
    if (nested.kind != dmk::PayloadKind::WrappedScript || nested.script != "f()") {
      std::cerr << "nested payload envelope not unwrapped\n";
      ++failures;
    }
    const auto block = dmk::classify_payload("{ var a = 1; }");
    if (block.kind != dmk::PayloadKind::Script) {
      std::cerr << "a JS block statement is script, not JSON\n";
      ++failures;
    }
    bool wrong_version = false;
    try {
      dmk::classify_payload("{\"schema_version\":\"dmk.plan.v0\",\"operations\":[]}");
    } catch (const dmk::MacroError& e) {
      wrong_version = e.code() == "modality_mismatch";
    }
    if (!wrong_version) {
      std::cerr << "unknown plan schema must not be treated as a plan\n";
      ++failures;
    }
  }

  // Test: capability scan.
  {
    const auto reasons = dmk::find_security_violations(
        "eval('1'); setTimeout(\"go()\", 5); while (true) {} fetch('/x'); import('m');");
    const std::vector<std::string> expected = {
        "disallowed dynamic evaluation (eval/Function)",
        "disallowed string-based timers (setTimeout/setInterval with string)",
        "potential infinite loop (while(true)/for(;;))",
        "disallowed network APIs (fetch/XMLHttpRequest/WebSocket)",
        "disallowed dynamic import",
    };
    if (reasons != expected) {
      std::cerr << "security reasons mismatch (" << reasons.size() << " found)\n";
      ++failures;
    }
    if (!dmk::find_security_violations("for (;;) { new XMLHttpRequest(); }").size()) {
      std::cerr << "for(;;)/XMLHttpRequest not detected\n";
      ++failures;
    }
    const auto quiet = dmk::find_security_violations(
        "var s = 'eval(x) fetch(y)'; // while(true)\nobj.eval(1); setTimeout(run, 10); var r = /fetch(/;");
    if (!quiet.empty()) {
      std::cerr << "literals, comments, member calls and function timers must not match: " << quiet.front()
                << "\n";
      ++failures;
    }
  }

  // Test: forbidden syntax for the host engine.
  {
    const auto found = dmk::find_forbidden_syntax(
        "var t = `x`; var f = a => a; class A {} async function g() { await h(); }");
    for (const char* name : {"template literal", "arrow function", "class declaration", "async/await"}) {
      if (!contains(found, name)) {
        std::cerr << "forbidden construct not reported: " << name << "\n";
        ++failures;
      }
    }
    if (!dmk::find_forbidden_syntax("var o = {class: 1}; var s = '=> `'; var async = 2;").empty()) {
      std::cerr << "keys, strings and plain identifiers are not forbidden constructs\n";
      ++failures;
    }
  }

  // Test: check_script raises the right kinds.
  {
    bool security = false;
    try {
      dmk::check_script("eval('x')", dmk::Directives{});
    } catch (const dmk::MacroError& e) {
      security = e.kind() == dmk::ErrorKind::SecurityViolation && e.code() == "disallowed_capability" &&
                 e.details().size() == 1;
    }
    if (!security) {
      std::cerr << "eval must raise SecurityViolation\n";
      ++failures;
    }

    dmk::Directives unsafe;
    unsafe.unsafe = true;
    bool passed = true;
    try {
      dmk::check_script("eval('x')", unsafe);
    } catch (const dmk::MacroError&) {
      passed = false;
    }
    if (!passed) {
      std::cerr << "unsafe directive must skip the capability scan\n";
      ++failures;
    }

    bool syntax = false;
    try {
      dmk::check_script("var f = a => a;", unsafe);
    } catch (const dmk::MacroError& e) {
      syntax = e.kind() == dmk::ErrorKind::SyntaxDefect && e.code() == "forbidden_syntax" &&
               contains(e.details(), "arrow function");
    }
    if (!syntax) {
      std::cerr << "unsafe directive must not skip the syntax check\n";
      ++failures;
    }
  }

  // Test: directives.
  {
    const auto d = dmk::parse_directives(
        "// @dmk:blockId=report 1\n// @DMK:anchor=end\n// @dmk:backup=off\n/* @dmk:direct */\nvar s = '// @dmk:unsafe';");
    if (!d.block_id || *d.block_id != "report") {
      std::cerr << "blockId value must end at whitespace\n";
      ++failures;
    }
    if (!d.anchor || *d.anchor != dmk::AnchorPlacement::End) {
      std::cerr << "anchor=end not parsed\n";
      ++failures;
    }
    if (!d.backup_off) {
      std::cerr << "backup=off not parsed\n";
      ++failures;
    }
    if (d.direct || d.unsafe) {
      std::cerr << "block comments only carry block ids; strings carry nothing\n";
      ++failures;
    }
    const auto alt = dmk::parse_directives("/* @dmk:block_id=a/b c */\n// @dmk:anchor=marker_only");
    if (!alt.block_id || *alt.block_id != "a_b" || alt.anchor_mode != dmk::AnchorMode::MarkerOnly) {
      std::cerr << "block_id spelling / anchor mode shorthand not parsed\n";
      ++failures;
    }
    if (dmk::sanitize_block_id(std::string(80, 'x')).size() != 64) {
      std::cerr << "block ids are capped at 64 characters\n";
      ++failures;
    }
    if (dmk::bookmark_name("1-st:block") != "DMK_B1_st_block") {
      std::cerr << "bookmark name mismatch: " << dmk::bookmark_name("1-st:block") << "\n";
      ++failures;
    }
    if (dmk::auto_block_id("f()") != dmk::auto_block_id("f()") ||
        dmk::auto_block_id("f()").rfind("dmk_auto_", 0) != 0 || dmk::auto_block_id("f()").size() != 17) {
      std::cerr << "auto block id must be stable and dmk_auto_<8 hex>\n";
      ++failures;
    }
    if (dmk::start_marker("r1") != "[[DMK:r1:START]]" || dmk::end_marker("r1") != "[[DMK:r1:END]]") {
      std::cerr << "marker text mismatch\n";
      ++failures;
    }
  }

  // Test: wrap decision.
  {
    dmk::Directives none;
    dmk::Directives with_id;
    with_id.block_id = "report1";
    const std::string insert = "Application.Selection.TypeText('x');";
    const std::string compute = "function f(){ return 1+1 } f()";

    if (dmk::should_wrap(compute, none, dmk::HostFlavor::Writer)) {
      std::cerr << "plain computation must not be wrapped\n";
      ++failures;
    }
    if (!dmk::should_wrap(compute, with_id, dmk::HostFlavor::Spreadsheet)) {
      std::cerr << "blockId directive must always wrap\n";
      ++failures;
    }
    if (!dmk::should_wrap(insert, none, dmk::HostFlavor::Writer) ||
        dmk::should_wrap(insert, none, dmk::HostFlavor::Spreadsheet)) {
      std::cerr << "insertion heuristic only applies to Writer\n";
      ++failures;
    }
    dmk::Directives direct = with_id;
    direct.direct = true;
    if (dmk::should_wrap(insert, direct, dmk::HostFlavor::Writer)) {
      std::cerr << "direct directive must disable wrapping\n";
      ++failures;
    }
    if (dmk::should_wrap("BID.upsertBlock('x', function(){ BID.typeText('a'); });", with_id,
                         dmk::HostFlavor::Writer)) {
      std::cerr << "body that upserts itself must not be wrapped again\n";
      ++failures;
    }
    if (dmk::looks_like_insertion("var s = 'x.Range.Text = 1';")) {
      std::cerr << "insertion patterns inside strings must not match\n";
      ++failures;
    }
  }

  // Test: runnable unit assembly.
  {
    const auto plain = dmk::build_runnable_unit("function f(){ return 1+1 } f()", dmk::Directives{},
                                                dmk::HostFlavor::Writer);
    const std::string tail = "\nfunction f(){ return 1+1 } f()\n";
    if (plain.wrapped || !contains(plain.code, "var BID = {") || plain.code.size() < tail.size() ||
        plain.code.compare(plain.code.size() - tail.size(), tail.size(), tail) != 0) {
      std::cerr << "unwrapped unit must be preamble + body\n";
      ++failures;
    }

    dmk::Directives d;
    d.block_id = "report1";
    d.anchor = dmk::AnchorPlacement::End;
    const auto wrapped = dmk::build_runnable_unit("function go(){ BID.typeText('Q1 results'); }\ngo();", d,
                                                  dmk::HostFlavor::Writer);
    if (!wrapped.wrapped || wrapped.block_id != "report1") {
      std::cerr << "blockId body must be wrapped under its id\n";
      ++failures;
    }
    if (!contains(wrapped.code, "BID.upsertBlock(\"report1\", function () {\n")) {
      std::cerr << "upsert envelope missing\n";
      ++failures;
    }
    if (!contains(wrapped.code, "return go();") || !contains(wrapped.code, "}, { anchor: 'end' });")) {
      std::cerr << "trailing call promotion or anchor option missing:\n" << wrapped.code << "\n";
      ++failures;
    }
    if (!contains(wrapped.notes, "wrapped body in BID.upsertBlock(report1)")) {
      std::cerr << "wrap note missing\n";
      ++failures;
    }

    const auto shim = dmk::shim_preamble(dmk::HostFlavor::Spreadsheet);
    if (!contains(shim, "host: 'spreadsheet'") || contains(shim, "Application.Selection = {")) {
      std::cerr << "spreadsheet preamble mismatch\n";
      ++failures;
    }
    if (!dmk::find_forbidden_syntax(dmk::shim_preamble(dmk::HostFlavor::Writer)).empty() ||
        !dmk::find_security_violations(dmk::shim_preamble(dmk::HostFlavor::Writer)).empty()) {
      std::cerr << "preamble must itself pass the gate\n";
      ++failures;
    }
  }

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}

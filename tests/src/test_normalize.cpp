#include "dmk/log.h"
#include "dmk/normalize.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

bool has_note(const dmk::NormalizationResult& result, const std::string& note) {
  return std::find(result.notes.begin(), result.notes.end(), note) != result.notes.end();
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", std::filesystem::current_path());

  int failures = 0;

  // Test: clean ES5 passes through untouched.
  {
    const std::string code = "function f(){ return 1+1 } f()";
    const auto result = dmk::normalize_source(code);
    if (result.changed || result.code != code || !result.notes.empty()) {
      std::cerr << "plain ES5 must not be rewritten: " << result.code << "\n";
      ++failures;
    }
  }

  // Test: let/const downgrade.
  {
    const auto result = dmk::normalize_source("let x = 1; const y = 2;");
    if (!result.changed || result.code != "var x = 1; var y = 2;") {
      std::cerr << "let/const downgrade mismatch: " << result.code << "\n";
      ++failures;
    }
    if (!has_note(result, "downgraded let/const to var")) {
      std::cerr << "downgrade note missing\n";
      ++failures;
    }
    const auto member = dmk::downgrade_declarations("opts.const = 1; var letter = 'let x';");
    if (member.changed) {
      std::cerr << "property names and string contents must not be downgraded\n";
      ++failures;
    }
  }

  // Test: control characters.
  {
    const std::string code = "\xEF\xBB\xBFvar a\xE2\x80\x8B = 1;\xE2\x80\xA8var b\xC2\xA0= 2;";
    const auto result = dmk::normalize_control_chars(code);
    if (result.code != "var a = 1;\nvar b = 2;") {
      std::cerr << "control char normalization mismatch: " << result.code << "\n";
      ++failures;
    }
    if (!has_note(result, "removed zero-width/BOM/line-separator characters")) {
      std::cerr << "control char note missing\n";
      ++failures;
    }
  }

  // Test: curly quotes in code are mapped, inside strings they are content.
  {
    const std::string code = "app.Log(\xE2\x80\x9Chi\xE2\x80\x9D\xEF\xBC\x89; var s = \"say \xE2\x80\x9Cyes\xE2\x80\x9D\";";
    const auto result = dmk::normalize_punctuation(code);
    if (!contains(result.code, "app.Log(\"hi\");")) {
      std::cerr << "curly quotes/fullwidth paren in code not mapped: " << result.code << "\n";
      ++failures;
    }
    if (!contains(result.code, "\"say \xE2\x80\x9Cyes\xE2\x80\x9D\"")) {
      std::cerr << "curly quotes inside a string literal must be preserved\n";
      ++failures;
    }
    if (!has_note(result, "normalized curly quotes/fullwidth punctuation")) {
      std::cerr << "punctuation note missing\n";
      ++failures;
    }
  }

  // Test: apostrophe inside curly quotes does not open a string.
  {
    const std::string code = "var a = \xE2\x80\x9C" "don't\xE2\x80\x9D\xEF\xBC\x9B\nfoo(a\xEF\xBC\x8C 2);";
    const auto result = dmk::normalize_source(code);
    if (result.code != "var a = \"don't\";\nfoo(a, 2);") {
      std::cerr << "apostrophe in curly string broke later code: " << result.code << "\n";
      ++failures;
    }
    const auto again = dmk::normalize_source(result.code);
    if (again.changed) {
      std::cerr << "apostrophe in curly string not idempotent: " << again.code << "\n";
      ++failures;
    }
  }

  // Test: raw line break inside a string literal.
  {
    const auto result = dmk::normalize_punctuation("var s = 'a\nb';");
    if (result.code != "var s = 'a\\nb';" || !has_note(result, "escaped literal newlines inside string literals")) {
      std::cerr << "raw newline in string not escaped: " << result.code << "\n";
      ++failures;
    }
  }

  // Test: markdown fences.
  {
    const auto result = dmk::strip_code_fences("```javascript\nvar a = 1;\n```");
    if (result.code != "\nvar a = 1;\n" || !has_note(result, "stripped markdown code fences")) {
      std::cerr << "fence stripping mismatch: " << result.code << "\n";
      ++failures;
    }
    const std::string in_template = "var t = `\n```\n`;";
    if (dmk::strip_code_fences(in_template).changed) {
      std::cerr << "fence line inside a template literal is content\n";
      ++failures;
    }
  }

  // Test: comments go, directives stay.
  {
    const std::string code = "// @dmk:blockId=r1\n// plain note\nvar a = 1; /* one */ var u = 'http://x';";
    const auto result = dmk::strip_comments(code, "@dmk:");
    if (!contains(result.code, "// @dmk:blockId=r1")) {
      std::cerr << "directive comment removed\n";
      ++failures;
    }
    if (contains(result.code, "plain note") || contains(result.code, "one")) {
      std::cerr << "plain comments survived: " << result.code << "\n";
      ++failures;
    }
    if (!contains(result.code, "'http://x'")) {
      std::cerr << "// inside a string treated as comment\n";
      ++failures;
    }
    if (!has_note(result, "stripped non-directive comments")) {
      std::cerr << "comment note missing\n";
      ++failures;
    }
  }

  // Test: template desugaring.
  {
    const auto one = dmk::desugar_templates("var s = `a${x}b`;");
    if (one.code != "var s = 'a' + (x) + 'b';") {
      std::cerr << "template desugar mismatch: " << one.code << "\n";
      ++failures;
    }
    if (!has_note(one, "converted template literals to string concatenation")) {
      std::cerr << "template note missing\n";
      ++failures;
    }
    const auto lead = dmk::desugar_templates("var s = `${x}`;");
    if (lead.code != "var s = '' + (x);") {
      std::cerr << "leading interpolation must start from an empty string: " << lead.code << "\n";
      ++failures;
    }
    const auto empty = dmk::desugar_templates("var s = ``;");
    if (empty.code != "var s = '';") {
      std::cerr << "empty template mismatch: " << empty.code << "\n";
      ++failures;
    }
    const auto quote = dmk::desugar_templates("var s = `it's\n${n}`;");
    if (quote.code != "var s = 'it\\'s\\n' + (n);") {
      std::cerr << "template quoting mismatch: " << quote.code << "\n";
      ++failures;
    }
    const auto nested = dmk::desugar_templates("var s = `a${ok ? `y${b}` : 'n'}`;");
    if (dmk::has_template_delimiter(nested.code) || !contains(nested.code, "('y' + (b))")) {
      std::cerr << "nested template not desugared: " << nested.code << "\n";
      ++failures;
    }
    const auto unterminated = dmk::desugar_templates("var s = `open");
    if (unterminated.changed) {
      std::cerr << "unterminated template must be left for the gate\n";
      ++failures;
    }
  }

  // Test: interpolated greeting through the whole pipeline.
  {
    const auto result = dmk::normalize_source("const name = \"World\";\n`Hello ${name}`");
    if (result.code != "var name = \"World\";\n'Hello ' + (name)") {
      std::cerr << "greeting pipeline mismatch: " << result.code << "\n";
      ++failures;
    }
  }

  // Test: stray escapes outside strings.
  {
    const auto result = dmk::repair_stray_escapes("var a = 1;\\nvar b = '\\n';");
    if (result.code != "var a = 1;\nvar b = '\\n';") {
      std::cerr << "stray escape repair mismatch: " << result.code << "\n";
      ++failures;
    }
    if (!has_note(result, "normalized stray \\n/\\r tokens outside strings")) {
      std::cerr << "stray escape note missing\n";
      ++failures;
    }
  }

  // Test: host call rewrites.
  {
    const std::string code = "var t = doc.Tables.Item(1);\nt.Cells(1, 2).Range.Text = 'x';\ndoc.Styles('Title');";
    const auto result = dmk::rewrite_host_calls(code, dmk::HostFlavor::Writer, "@dmk:");
    if (!contains(result.code, "t.Rows.Item(1).Cells.Item(2).Range.Text")) {
      std::cerr << "table cell rewrite missing: " << result.code << "\n";
      ++failures;
    }
    if (!contains(result.code, "doc.Styles.Item('Title')")) {
      std::cerr << "styles rewrite missing: " << result.code << "\n";
      ++failures;
    }
    if (!has_note(result, "rewrote table.Cells(r, c) to table.Rows.Item(r).Cells.Item(c)") ||
        !has_note(result, "normalized Styles(x) -> Styles.Item(x)")) {
      std::cerr << "host rewrite notes missing\n";
      ++failures;
    }

    const auto sheet = dmk::rewrite_host_calls("var s = app.ActiveSheet;\ns.Cells(2, 3).Value2 = 1;",
                                               dmk::HostFlavor::Spreadsheet, "@dmk:");
    if (!contains(sheet.code, "s.Cells.Item(2, 3).Value2")) {
      std::cerr << "sheet cell rewrite missing: " << sheet.code << "\n";
      ++failures;
    }

    const auto alert = dmk::rewrite_host_calls("// @dmk:blockId=a\napp.Alert('done');", dmk::HostFlavor::Writer,
                                               "@dmk:");
    if (!contains(alert.code, "__dmk_safe_alert(app, 'done');") ||
        alert.code.find("// @dmk:blockId=a\nfunction __dmk_safe_alert") != 0) {
      std::cerr << "alert rewrite mismatch: " << alert.code << "\n";
      ++failures;
    }
    if (!has_note(alert, "normalized app.Alert calls") || !has_note(alert, "injected safe alert helper")) {
      std::cerr << "alert notes missing\n";
      ++failures;
    }
    if (dmk::rewrite_host_calls(alert.code, dmk::HostFlavor::Writer, "@dmk:").changed) {
      std::cerr << "alert rewrite must be idempotent\n";
      ++failures;
    }

    const auto alias = dmk::rewrite_host_calls("var BID = window.BID;\nBID.log('x');", dmk::HostFlavor::Writer,
                                               "@dmk:");
    if (contains(alias.code, "window.BID") || !has_note(alias, "stripped redundant `var BID = window.BID;`")) {
      std::cerr << "BID alias not stripped: " << alias.code << "\n";
      ++failures;
    }
  }

  // Test: type syntax.
  {
    const auto fn = dmk::strip_type_syntax("function f(a: number, b: string): string {\n  return b;\n}");
    if (fn.code.find("function f(a, b) {") != 0) {
      std::cerr << "parameter/return annotations not stripped: " << fn.code << "\n";
      ++failures;
    }
    if (!has_note(fn, "stripped parameter type annotations") || !has_note(fn, "stripped return type annotations")) {
      std::cerr << "annotation notes missing\n";
      ++failures;
    }
    const auto var = dmk::strip_type_syntax("var x: number = 5;");
    if (var.code != "var x = 5;" || !has_note(var, "stripped variable type annotations")) {
      std::cerr << "variable annotation mismatch: " << var.code << "\n";
      ++failures;
    }
    const auto as = dmk::strip_type_syntax("var s = obj as string;\nel!.focus();");
    if (as.code != "var s = obj;\nel.focus();") {
      std::cerr << "as/non-null mismatch: " << as.code << "\n";
      ++failures;
    }
    if (!has_note(as, "removed \"as Type\" assertions") || !has_note(as, "removed non-null assertions")) {
      std::cerr << "as/non-null notes missing\n";
      ++failures;
    }
    const auto imp = dmk::strip_type_syntax("import x from 'y';\nvar a = 1;");
    if (imp.code != "\nvar a = 1;" || !has_note(imp, "removed import statements")) {
      std::cerr << "import removal mismatch: " << imp.code << "\n";
      ++failures;
    }
    const auto decl = dmk::strip_type_syntax("interface Row {\n  id: number;\n}\nenum Color { Red }\nvar r = 1;");
    if (decl.code != "\n\n\n\nvar r = 1;" || !has_note(decl, "removed interface declarations") ||
        !has_note(decl, "removed enum declarations")) {
      std::cerr << "interface/enum removal mismatch: " << decl.code << "\n";
      ++failures;
    }
    const std::string es5_names = "namespace = 'x';\ndeclare(namespace);\ninterface.id = 3;";
    const auto names = dmk::strip_type_syntax(es5_names);
    if (names.changed || names.code != es5_names) {
      std::cerr << "ES5 identifiers named like declarations must stay: " << names.code << "\n";
      ++failures;
    }
    const auto ternary = dmk::strip_type_syntax("var v = ok ? a : b;\nvar o = {k: 1};");
    if (ternary.changed) {
      std::cerr << "ternaries and object literals are not annotations: " << ternary.code << "\n";
      ++failures;
    }
  }

  // Test: the pipeline is idempotent.
  {
    const char* inputs[] = {
        "let a = `v${1}`; // c\napp.Alert(\xE2\x80\x9Cx\xE2\x80\x9D);",
        "const t = doc.Tables.Add(r, 2, 2);\nt.Cells(1, 1).Range.Text = 'a';",
        "function g(p: number): number { return p!; }\ng(1)",
    };
    for (const char* input : inputs) {
      const auto once = dmk::normalize_source(input);
      const auto twice = dmk::normalize_source(once.code);
      if (twice.changed || twice.code != once.code) {
        std::cerr << "normalization not idempotent for: " << input << "\n  first:  " << once.code
                  << "\n  second: " << twice.code << "\n";
        ++failures;
      }
    }
  }

  // Test: suspicious character report.
  {
    const auto found = dmk::find_suspicious_chars("var a = \xE2\x80\x9Cx\xE2\x80\x9D;");
    if (found.size() != 2 || found[0].code_point != "U+201C" || found[0].offset != 8) {
      std::cerr << "suspicious char report mismatch\n";
      ++failures;
    }
  }

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}

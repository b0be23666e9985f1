#include "test_util.hpp"
#include "annotate/genome_loader.hpp"
#include "annotate/quality_filter.hpp"
#include "io/genome_info_reader.hpp"
#include "io/genome_list_reader.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace panannot;

static std::string g_test_dir;

static void test_parse_line_variants() {
    std::fprintf(stderr, "-- test_parse_line_variants\n");

    GenomeListEntry e;
    CHECK(!parse_genome_list_line("", e));
    CHECK(!parse_genome_list_line("   \r", e));
    CHECK(!parse_genome_list_line("# comment", e));

    CHECK(parse_genome_list_line("g1.fna\r", e));
    CHECK_EQ(e.files.size(), 1u);
    CHECK_STR(e.files[0], "g1.fna");
    CHECK(e.prefix_override.empty());
    CHECK(e.date_override.empty());

    CHECK(parse_genome_list_line("g1.fna  g1b.fna\tg1c.fna", e));
    CHECK_EQ(e.files.size(), 3u);
    CHECK_STR(e.files[2], "g1c.fna");

    CHECK(parse_genome_list_line("g2.fna :: ABCD", e));
    CHECK_STR(e.prefix_override, "ABCD");
    CHECK(e.date_override.empty());

    CHECK(parse_genome_list_line("g2.fna :: ABCD.", e));
    CHECK_STR(e.prefix_override, "ABCD");
    CHECK(e.date_override.empty());

    CHECK(parse_genome_list_line("g2.fna::ABCD.0519", e));
    CHECK_EQ(e.files.size(), 1u);
    CHECK_STR(e.prefix_override, "ABCD");
    CHECK_STR(e.date_override, "0519");

    CHECK(parse_genome_list_line("g2.fna :: .0519", e));
    CHECK(e.prefix_override.empty());
    CHECK_STR(e.date_override, "0519");

    // Override without any file
    CHECK(!parse_genome_list_line(":: ABCD", e));
}

static void test_read_list_line_numbers() {
    std::fprintf(stderr, "-- test_read_list_line_numbers\n");

    std::string path = g_test_dir + "/list.txt";
    write_text_file(path, "# genomes\nA.fna\n\nB.fna :: TEST\n");

    std::vector<GenomeListEntry> entries;
    std::string err;
    CHECK(read_genome_list(path, entries, err));
    CHECK_EQ(entries.size(), 2u);
    CHECK_EQ(entries[0].line_number, 2u);
    CHECK_EQ(entries[1].line_number, 4u);
    CHECK_STR(entries[1].prefix_override, "TEST");

    entries.clear();
    CHECK(!read_genome_list(g_test_dir + "/none.txt", entries, err));
    CHECK(!err.empty());
}

static void test_read_list_rejects_bad_overrides() {
    std::fprintf(stderr, "-- test_read_list_rejects_bad_overrides\n");

    std::vector<GenomeListEntry> entries;
    std::string err;
    std::string path = g_test_dir + "/bad_prefix.txt";
    write_text_file(path, "A.fna :: ESCO.0519\nB.fna :: AB\n");
    CHECK(!read_genome_list(path, entries, err));
    CHECK(err.find(":2: prefix 'AB'") != std::string::npos);

    entries.clear();
    path = g_test_dir + "/bad_chars.txt";
    write_text_file(path, "A.fna :: ES-O\n");
    CHECK(!read_genome_list(path, entries, err));
    CHECK(err.find("prefix 'ES-O'") != std::string::npos);

    entries.clear();
    path = g_test_dir + "/bad_date.txt";
    write_text_file(path, "A.fna :: .05190\n");
    CHECK(!read_genome_list(path, entries, err));
    CHECK(err.find(":1: date '05190'") != std::string::npos);

    entries.clear();
    path = g_test_dir + "/good.txt";
    write_text_file(path, "A.fna :: ESCO.\nB.fna :: .0519\nC.fna :: KLPN.1220\n");
    CHECK(read_genome_list(path, entries, err));
    CHECK_EQ(entries.size(), 3u);
}

static void test_loader_yields_records() {
    std::fprintf(stderr, "-- test_loader_yields_records\n");

    std::string gdir = g_test_dir + "/genomes";
    std::filesystem::create_directories(gdir);
    write_text_file(gdir + "/A.fna", ">a1\nACGTACGTAC\n>a2\nACGTA\n");
    write_text_file(gdir + "/B1.fna", ">b1\nAAAANNNNNCCCC\n");
    write_text_file(gdir + "/B2.fna", ">b2\nGG\n");
    std::string list = g_test_dir + "/loader.lst";
    write_text_file(list, "A.fna\nmissing.fna\nB1.fna B2.fna :: BBBB.0101\n");

    GenomeLoader loader;
    StageError err;
    CHECK(loader.load(list, gdir, err));
    CHECK(!err.failed());
    CHECK_EQ(loader.size(), 3u);

    GenomeRecord rec;
    CHECK(loader.next(rec));
    CHECK_STR(rec.identifier, "A.fna");
    CHECK(rec.readable);
    CHECK_EQ(rec.contig_lengths.size(), 2u);
    CHECK_EQ(rec.total_length, 15u);
    CHECK_EQ(rec.list_index, 0u);

    // A missing file is reported on the record, not as a load failure
    CHECK(loader.next(rec));
    CHECK_STR(rec.identifier, "missing.fna");
    CHECK(!rec.readable);
    CHECK(rec.load_error.find("missing.fna") != std::string::npos);

    // Two files concatenated; the N run splits b1 in two
    CHECK(loader.next(rec));
    CHECK_STR(rec.identifier, "B1.fna");
    CHECK_EQ(rec.paths.size(), 2u);
    CHECK_EQ(rec.contig_lengths.size(), 3u);
    CHECK_EQ(rec.contig_lengths[0], 4u);
    CHECK_EQ(rec.contig_lengths[1], 4u);
    CHECK_EQ(rec.contig_lengths[2], 2u);
    CHECK_EQ(rec.total_length, 10u);
    CHECK_STR(rec.prefix_override, "BBBB");
    CHECK_STR(rec.date_override, "0101");
    CHECK_EQ(rec.list_index, 2u);

    CHECK(!loader.next(rec));

    // Reloading starts over from disk
    CHECK(loader.load(list, gdir, err));
    CHECK(loader.next(rec));
    CHECK_STR(rec.identifier, "A.fna");
}

static void test_loader_cut_n_disabled() {
    std::fprintf(stderr, "-- test_loader_cut_n_disabled\n");

    std::string gdir = g_test_dir + "/genomes";
    std::string list = g_test_dir + "/cut.lst";
    write_text_file(list, "B1.fna\n");

    GenomeLoader loader(0);
    StageError err;
    CHECK(loader.load(list, gdir, err));
    GenomeRecord rec;
    CHECK(loader.next(rec));
    CHECK_EQ(rec.contig_lengths.size(), 1u);
    CHECK_EQ(rec.total_length, 13u);
}

static void test_loader_config_errors() {
    std::fprintf(stderr, "-- test_loader_config_errors\n");

    std::string gdir = g_test_dir + "/genomes";
    GenomeLoader loader;
    StageError err;

    CHECK(!loader.load(g_test_dir + "/absent.lst", gdir, err));
    CHECK(err.kind == ErrorKind::kConfig);

    err.clear();
    std::string list = g_test_dir + "/loader.lst";
    CHECK(!loader.load(list, g_test_dir + "/no_such_dir", err));
    CHECK(err.kind == ErrorKind::kConfig);

    err.clear();
    std::string empty = g_test_dir + "/empty.lst";
    write_text_file(empty, "# nothing here\n\n");
    CHECK(!loader.load(empty, gdir, err));
    CHECK(err.kind == ErrorKind::kConfig);
}

static void test_read_genome_info() {
    std::fprintf(stderr, "-- test_read_genome_info\n");

    // Column order and extra columns do not matter
    std::istringstream in(
        "to_annotate\tgsize\torig_name\tnb_conts\tL90\n"
        "tmp/A.fna-split5N.fna\t9876\tA.fna\t12\t3\n"
        "\n"
        "tmp/B.fna\t100\tB.fna\tmany\t1\n"
        "tmp/C.fna\t100\tC.fna\t2\t5\n"
        "tmp/D.fna\t100\tD.fna\t2\n");
    std::vector<GenomeInfoEntry> entries;
    std::string err;
    CHECK(read_genome_info(in, entries, err));
    CHECK_EQ(entries.size(), 4u);
    CHECK_STR(entries[0].identifier, "A.fna");
    CHECK(entries[0].valid);
    CHECK_EQ(entries[0].metrics.genome_size, 9876u);
    CHECK_EQ(entries[0].metrics.nb_contigs, 12u);
    CHECK_EQ(entries[0].metrics.l90, 3u);
    CHECK_EQ(entries[0].line_number, 2u);
    CHECK(!entries[1].valid);
    CHECK(!entries[2].valid);     // L90 above contig count
    CHECK(entries[2].error.find("L90 5") != std::string::npos);
    CHECK(!entries[3].valid);     // short row

    // LSTINFO written by a previous run
    std::istringstream lstinfo(
        "# name\toriginal_name\tgenome_size\tnb_contigs\tL90\n"
        "ESCO.1\tA.fna\t1050\t2\t1\n");
    entries.clear();
    CHECK(read_genome_info(lstinfo, entries, err));
    CHECK_EQ(entries.size(), 1u);
    CHECK_STR(entries[0].identifier, "A.fna");
    CHECK_EQ(entries[0].metrics.genome_size, 1050u);

    std::istringstream no_l90("orig_name\tgsize\tnb_conts\nA.fna\t1\t1\n");
    entries.clear();
    CHECK(!read_genome_info(no_l90, entries, err));
    CHECK(err.find("L90") != std::string::npos);

    std::istringstream empty("");
    CHECK(!read_genome_info(empty, entries, err));

    CHECK(!read_genome_info(g_test_dir + "/no_info.txt", entries, err));
}

static void test_loader_from_info() {
    std::fprintf(stderr, "-- test_loader_from_info\n");

    std::string gdir = g_test_dir + "/genomes";
    std::string info = g_test_dir + "/genomes.info";
    write_text_file(info,
        "orig_name\tgsize\tnb_conts\tL90\n"
        "A.fna\t5000\t40\t20\n"
        "missing.fna\t10\t1\t1\n"
        "B1.fna\t13\tx\t1\n"
        + gdir + "/B2.fna\t2\t1\t1\n");

    GenomeLoader loader;
    StageError err;
    CHECK(loader.load_info(info, gdir, err));
    CHECK_EQ(loader.size(), 4u);

    // Metrics come from the file, not from the sequence (A.fna has 2 contigs)
    GenomeRecord rec;
    CHECK(loader.next(rec));
    CHECK_STR(rec.identifier, "A.fna");
    CHECK(rec.readable);
    CHECK(rec.has_known_metrics);
    CHECK(rec.contig_lengths.empty());
    QualityMetrics m = compute_metrics(rec);
    CHECK_EQ(m.genome_size, 5000u);
    CHECK_EQ(m.nb_contigs, 40u);
    CHECK_EQ(m.l90, 20u);
    QualityThresholds t;
    t.max_l90 = 10;
    AcceptanceDecision d = evaluate(rec, t);
    CHECK(!d.accepted);
    CHECK(d.reason == RejectReason::kL90TooHigh);

    CHECK(loader.next(rec));
    CHECK(!rec.readable);
    CHECK(rec.load_error.find("not found") != std::string::npos);

    CHECK(loader.next(rec));
    CHECK(!rec.readable);
    CHECK(rec.load_error.find("line 4") != std::string::npos);
    CHECK(evaluate(rec, t).reason == RejectReason::kUnreadable);

    // Absolute paths are used as given
    CHECK(loader.next(rec));
    CHECK(rec.readable);
    CHECK_STR(rec.paths[0], gdir + "/B2.fna");
    CHECK(evaluate(rec, t).accepted);

    CHECK(!loader.next(rec));

    // Switching back to a list file
    std::string list = g_test_dir + "/cut.lst";
    CHECK(loader.load(list, gdir, err));
    CHECK(loader.next(rec));
    CHECK(!rec.has_known_metrics);
    CHECK_EQ(rec.contig_lengths.size(), 2u);

    err.clear();
    std::string empty = g_test_dir + "/empty.info";
    write_text_file(empty, "orig_name\tgsize\tnb_conts\tL90\n");
    CHECK(!loader.load_info(empty, gdir, err));
    CHECK(err.kind == ErrorKind::kConfig);
}

int main() {
    g_test_dir = make_test_dir("panannot_list_test");

    test_parse_line_variants();
    test_read_list_line_numbers();
    test_read_list_rejects_bad_overrides();
    test_loader_yields_records();
    test_loader_cut_n_disabled();
    test_loader_config_errors();
    test_read_genome_info();
    test_loader_from_info();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}

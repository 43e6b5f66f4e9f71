#include "ogr_record_store.h"
#include <filesystem>
#include <utility>
#include <sstream>

#include "errors.h"

namespace fs = std::filesystem;

namespace geosync {

namespace {

Value read_field(OGRFeature &feat, int idx) {
    if (!feat.IsFieldSetAndNotNull(idx)) return Value{};
    OGRFieldDefn *defn = feat.GetFieldDefnRef(idx);
    switch (defn->GetType()) {
        case OFTInteger:
            if (defn->GetSubType() == OFSTBoolean) return Value{feat.GetFieldAsInteger(idx) != 0};
            return Value{static_cast<std::int64_t>(feat.GetFieldAsInteger(idx))};
        case OFTInteger64:
            return Value{static_cast<std::int64_t>(feat.GetFieldAsInteger64(idx))};
        case OFTReal:
            return Value{feat.GetFieldAsDouble(idx)};
        default:
            return Value{std::string(feat.GetFieldAsString(idx))};
    }
}

void write_field(OGRFeature &feat, int idx, const Value &v) {
    if (is_absent(v)) {
        feat.SetFieldNull(idx);
    } else if (const bool *b = std::get_if<bool>(&v)) {
        feat.SetField(idx, *b ? 1 : 0);
    } else if (const std::int64_t *i = std::get_if<std::int64_t>(&v)) {
        feat.SetField(idx, static_cast<GIntBig>(*i));
    } else if (const double *d = std::get_if<double>(&v)) {
        feat.SetField(idx, *d);
    } else {
        feat.SetField(idx, std::get<std::string>(v).c_str());
    }
}

// Field type covering every non-absent value of a column.
std::pair<OGRFieldType, OGRFieldSubType> field_type_for(const std::string &name,
                                                        const std::vector<const Table*> &tables) {
    bool anyInt = false, anyReal = false, anyBool = false, anyText = false;
    for (const Table *t : tables) {
        for (const auto &row : t->rows) {
            const Value &v = row.get(name);
            if (is_absent(v)) continue;
            if (std::holds_alternative<bool>(v))              anyBool = true;
            else if (std::holds_alternative<std::int64_t>(v)) anyInt = true;
            else if (std::holds_alternative<double>(v))       anyReal = true;
            else                                              anyText = true;
        }
    }
    if (anyText || (anyBool && (anyInt || anyReal))) return {OFTString, OFSTNone};
    if (anyReal)                                     return {OFTReal, OFSTNone};
    if (anyInt)                                      return {OFTInteger64, OFSTNone};
    if (anyBool)                                     return {OFTInteger, OFSTBoolean};
    return {OFTString, OFSTNone};
}

void fill_feature(OGRFeature &feat, const Record &row, const std::vector<std::string> &columns) {
    OGRFeatureDefn *defn = feat.GetDefnRef();
    for (const auto &col : columns) {
        const int idx = defn->GetFieldIndex(col.c_str());
        if (idx >= 0) write_field(feat, idx, row.get(col));
    }
    if (row.geometry && defn->GetGeomFieldCount() > 0) {
        OGRPoint pt(row.geometry->x(), row.geometry->y());
        feat.SetGeometry(&pt);
    }
}

} // namespace

OgrRecordStore::OgrRecordStore(std::string file_path, std::string driver, std::string layer_name,
                               int epsg, Logger &log)
    : file_path_(std::move(file_path)), driver_(std::move(driver)),
      layer_name_(std::move(layer_name)), epsg_(epsg), log_(log) {}

std::string OgrRecordStore::describe() const {
    return file_path_ + ":" + layer_name_;
}

Table OgrRecordStore::load_all(const std::string &key_column) {
    ensure_gdal_registered();
    Table table;
    if (!fs::exists(file_path_)) return table;

    DatasetPtr ds(static_cast<GDALDataset*>(
        GDALOpenEx(file_path_.c_str(), GDAL_OF_VECTOR, nullptr, nullptr, nullptr)));
    if (!ds) throw StoreCommitError("Unable to open store: " + file_path_);

    OGRLayer *layer = ds->GetLayerByName(layer_name_.c_str());
    if (!layer) return table;

    OGRFeatureDefn *defn = layer->GetLayerDefn();
    for (int i = 0; i < defn->GetFieldCount(); ++i)
        table.columns.push_back(defn->GetFieldDefn(i)->GetNameRef());
    if (!table.has_column(key_column))
        throw SchemaError("Key column '" + key_column + "' missing from " + describe());

    layer->ResetReading();
    OGRFeature *raw;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feat(raw);
        Record r;
        for (int i = 0; i < defn->GetFieldCount(); ++i)
            r.set(table.columns[i], read_field(*feat, i));
        const OGRGeometry *geom = feat->GetGeometryRef();
        if (geom && wkbFlatten(geom->getGeometryType()) == wkbPoint && !geom->IsEmpty()) {
            const OGRPoint *pt = geom->toPoint();
            Geometry g;
            g.point = BoostPoint(pt->getX(), pt->getY());
            g.epsg = epsg_;
            r.geometry = g;
        }
        table.rows.push_back(std::move(r));
    }
    log_.debug("load_all", std::to_string(table.size()) + " stored entries loaded from " + describe());
    return table;
}

DatasetPtr OgrRecordStore::open_for_update() {
    ensure_gdal_registered();
    if (fs::exists(file_path_)) {
        DatasetPtr ds(static_cast<GDALDataset*>(
            GDALOpenEx(file_path_.c_str(), GDAL_OF_VECTOR | GDAL_OF_UPDATE, nullptr, nullptr, nullptr)));
        if (!ds) throw StoreCommitError("Unable to open store for update: " + file_path_);
        return ds;
    }
    GDALDriver *drv = GetGDALDriverManager()->GetDriverByName(driver_.c_str());
    if (!drv) throw StoreCommitError("GDAL driver not available: " + driver_);
    DatasetPtr ds(drv->Create(file_path_.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!ds) throw StoreCommitError("Unable to create store: " + file_path_);
    log_.info("commit", "Created " + driver_ + " store " + file_path_);
    return ds;
}

OGRLayer *OgrRecordStore::ensure_layer(GDALDataset &ds, const ReconciliationPlan &plan) {
    OGRLayer *layer = ds.GetLayerByName(layer_name_.c_str());
    if (layer) return layer;

    bool spatial = false;
    for (const auto &row : plan.insert_set.rows) {
        if (row.geometry) { spatial = true; break; }
    }
    OGRSpatialReference srs = make_srs(epsg_);
    layer = ds.CreateLayer(layer_name_.c_str(), spatial ? &srs : nullptr,
                           spatial ? wkbPoint : wkbNone, nullptr);
    if (!layer) throw StoreCommitError("Unable to create layer " + layer_name_ + " in " + file_path_);
    return layer;
}

void OgrRecordStore::ensure_fields(OGRLayer &layer, const ReconciliationPlan &plan) {
    const std::vector<const Table*> tables{&plan.insert_set, &plan.merged};
    const std::vector<std::string> columns = union_columns(plan.merged.columns, plan.insert_set.columns);
    for (const auto &col : columns) {
        if (layer.GetLayerDefn()->GetFieldIndex(col.c_str()) >= 0) continue;
        const auto type = field_type_for(col, tables);
        OGRFieldDefn defn(col.c_str(), type.first);
        defn.SetSubType(type.second);
        if (layer.CreateField(&defn) != OGRERR_NONE)
            throw StoreCommitError("Unable to add field " + col + " to " + describe());
        log_.debug("commit", "Added field " + col + " to " + describe());
    }
}

void OgrRecordStore::commit(const ReconciliationPlan &plan) {
    DatasetPtr ds = open_for_update();
    OGRLayer *layer = ensure_layer(*ds, plan);
    ensure_fields(*layer, plan);

    // Stored row i of load_all() is the i-th feature in reading order.
    std::vector<GIntBig> fids;
    layer->ResetReading();
    OGRFeature *raw;
    while ((raw = layer->GetNextFeature()) != nullptr) {
        fids.push_back(raw->GetFID());
        OGRFeature::DestroyFeature(raw);
    }
    if (fids.size() != plan.update_mask.size()) {
        throw StoreCommitError("Update mask covers " + std::to_string(plan.update_mask.size()) +
                               " rows but " + describe() + " holds " + std::to_string(fids.size()) +
                               "; plan is stale.");
    }

    if (ds->StartTransaction(TRUE) != OGRERR_NONE)
        throw StoreCommitError("Unable to start transaction on " + describe());

    try {
        for (size_t i = 0; i < fids.size(); ++i) {
            if (!plan.update_mask[i]) continue;
            OGRFeatureUniquePtr feat(layer->GetFeature(fids[i]));
            if (!feat) throw StoreCommitError("Stored feature " + std::to_string(fids[i]) + " vanished");
            fill_feature(*feat, plan.merged.rows[i], plan.merged.columns);
            if (layer->SetFeature(feat.get()) != OGRERR_NONE)
                throw StoreCommitError("Update of feature " + std::to_string(fids[i]) + " failed");
        }
        for (const auto &row : plan.insert_set.rows) {
            OGRFeatureUniquePtr feat(OGRFeature::CreateFeature(layer->GetLayerDefn()));
            fill_feature(*feat, row, plan.insert_set.columns);
            if (layer->CreateFeature(feat.get()) != OGRERR_NONE)
                throw StoreCommitError("Insert into " + describe() + " failed");
        }
    } catch (const std::exception &e) {
        if (ds->RollbackTransaction() != OGRERR_NONE)
            log_.error("commit", "Rollback failed on " + describe());
        throw StoreCommitError(e.what());
    }

    if (ds->CommitTransaction() != OGRERR_NONE)
        throw StoreCommitError("Commit failed on " + describe());

    std::ostringstream msg;
    msg << "Inserting " << plan.insert_set.size() << " new entries, updating "
        << plan.update_count() << " existing entries in " << describe();
    log_.info("commit", msg.str());
}

} // namespace geosync
